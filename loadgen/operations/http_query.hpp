#pragma once

#include "httplib.h"
#include "../harness_profile.hpp"
#include "../operation.hpp"

/**
 * @brief Read operation that GETs every configured read path of the
 * target (e.g. the metrics endpoint of each voting component).
 * ok only if all of them answer 200.
 */
class HttpQuery : public IQueryOperation {
    HttpTarget target;
    std::unique_ptr<httplib::Client> cli;
public:
    explicit HttpQuery(const HttpTarget& target)
        : target(target), cli(std::make_unique<httplib::Client>(target.base_url)) {
        cli->set_keep_alive(true);
        cli->set_tcp_nodelay(true);
        cli->set_connection_timeout(target.timeout_sec);
        cli->set_read_timeout(target.timeout_sec);
        cli->set_write_timeout(target.timeout_sec);
    }

    OperationResult execute(std::mt19937& /*gen*/) override {
        for (const auto& path : target.query_paths) {
            auto res = cli->Get(path.c_str());
            if (!res) {
                return {false, "Query error: GET " + path + ": " + httplib::to_string(res.error())};
            }
            if (res->status != 200) {
                return {false, "Query error: GET " + path + " returned HTTP " + std::to_string(res->status)};
            }
        }
        return {};
    }

    std::unique_ptr<IQueryOperation> clone() const override {
        return std::make_unique<HttpQuery>(target);
    }
};
