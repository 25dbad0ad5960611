#pragma once

#include "httplib.h"
#include "../harness_profile.hpp"
#include "../operation.hpp"

#include <sstream>

/**
 * @brief Vote submission that POSTs the ballot as JSON to the vote path.
 * Only HTTP 200 counts as accepted.
 */
class HttpVote : public IVoteOperation {
    HttpTarget target;
    std::unique_ptr<httplib::Client> cli;
public:
    explicit HttpVote(const HttpTarget& target)
        : target(target), cli(std::make_unique<httplib::Client>(target.base_url)) {
        cli->set_keep_alive(true);
        cli->set_tcp_nodelay(true);
        cli->set_connection_timeout(target.timeout_sec);
        cli->set_read_timeout(target.timeout_sec);
        cli->set_write_timeout(target.timeout_sec);
    }

    OperationResult submit(const Ballot& ballot, std::mt19937& /*gen*/) override {
        std::ostringstream body;
        body << "{\"vote_id\": \"" << ballot.vote_id << "\", "
             << "\"candidate_id\": \"" << ballot.candidate_id << "\"}";

        auto res = cli->Post(target.vote_path, body.str(), "application/json");
        if (!res) {
            return {false, "POST " + target.vote_path + ": " + httplib::to_string(res.error())};
        }
        if (res->status != 200) {
            return {false, "POST " + target.vote_path + " returned HTTP " + std::to_string(res->status)};
        }
        return {};
    }

    std::unique_ptr<IVoteOperation> clone() const override {
        return std::make_unique<HttpVote>(target);
    }
};
