#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <random>
#include <string>

// Empty means non-deterministic (std::random_device).
using WorkerSeed = std::optional<std::uint32_t>;

/**
 * @brief Builds a worker's generator. Any given seed, including 0 and
 * 0xFFFFFFFF, gives a reproducible stream.
 */
inline std::mt19937 seeded_generator(WorkerSeed seed) {
    std::mt19937 gen;
    if (seed) {
        gen.seed(*seed);
    } else {
        gen.seed(std::random_device{}());
    }
    return gen;
}

struct OperationResult {
    bool ok = true;
    std::string detail;     // why it failed, empty on success
};

struct Ballot {
    std::string vote_id;
    std::string candidate_id;
};

/**
 * @brief Abstract interface for one read ("consulta") operation.
 *
 * Each worker thread receives its own clone, allowing it to keep its own
 * state (random distributions, HTTP connection) without locks.
 */
class IQueryOperation {
public:
    virtual ~IQueryOperation() = default;

    /**
     * @brief Executes a single read against the system under test.
     * @param gen The random number generator dedicated to this worker.
     * @return ok=false if the system answered with an error.
     * @throws std::exception on any other failure.
     */
    virtual OperationResult execute(std::mt19937& gen) = 0;

    virtual std::unique_ptr<IQueryOperation> clone() const = 0;
};

/**
 * @brief Abstract interface for one vote submission.
 */
class IVoteOperation {
public:
    virtual ~IVoteOperation() = default;

    /**
     * @brief Submits one ballot.
     * @return ok=false if the system rejected the vote.
     * @throws std::exception on any other failure.
     */
    virtual OperationResult submit(const Ballot& ballot, std::mt19937& gen) = 0;

    virtual std::unique_ptr<IVoteOperation> clone() const = 0;
};
