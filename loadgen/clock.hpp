#pragma once

#include <chrono>
#include <thread>

/**
 * @brief Time source shared by every worker of a run.
 *
 * Workers never call std::this_thread directly so that tests can
 * substitute virtual time and make whole runs deterministic.
 */
class IClock {
public:
    using time_point = std::chrono::steady_clock::time_point;
    using duration = std::chrono::steady_clock::duration;

    virtual ~IClock() = default;

    virtual time_point now() = 0;
    virtual void sleep_for(duration d) = 0;

    /**
     * @brief Blocks until the given instant. Returns at once if it has
     * already passed.
     */
    virtual void sleep_until(time_point t) = 0;

    template <typename Rep, typename Period>
    void sleep_for(std::chrono::duration<Rep, Period> d) {
        sleep_for(std::chrono::duration_cast<duration>(d));
    }
};

class SteadyClock : public IClock {
public:
    time_point now() override { return std::chrono::steady_clock::now(); }

    void sleep_for(duration d) override { std::this_thread::sleep_for(d); }

    void sleep_until(time_point t) override { std::this_thread::sleep_until(t); }

    using IClock::sleep_for;
};
