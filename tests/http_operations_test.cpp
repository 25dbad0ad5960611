#include <gtest/gtest.h>

#include "fake_voting_server.hpp"
#include "harness_profile.hpp"
#include "operations/http_query.hpp"
#include "operations/http_vote.hpp"

#include <string>

TEST(HttpQuery, AllPathsAnswering200IsSuccess) {
    FakeVotingServer server;
    HttpTarget target = server.target();
    target.query_paths = {"/metrics", "/metrics"};

    std::mt19937 gen(1);
    HttpQuery query(target);
    OperationResult res = query.execute(gen);

    EXPECT_TRUE(res.ok) << res.detail;
    EXPECT_EQ(server.metrics_hits.load(), 2);
}

TEST(HttpQuery, NonOkStatusIsReported) {
    FakeVotingServer server;
    HttpTarget target = server.target();
    target.query_paths = {"/broken"};

    std::mt19937 gen(1);
    auto query = HttpQuery(target).clone();
    OperationResult res = query->execute(gen);

    EXPECT_FALSE(res.ok);
    EXPECT_NE(res.detail.find("HTTP 503"), std::string::npos);
}

TEST(HttpQuery, UnreachableTargetIsReported) {
    HttpTarget target;
    target.base_url = "http://127.0.0.1:1";
    target.timeout_sec = 1;

    std::mt19937 gen(1);
    HttpQuery query(target);
    OperationResult res = query.execute(gen);

    EXPECT_FALSE(res.ok);
    EXPECT_NE(res.detail.find("GET /metrics"), std::string::npos);
}

TEST(HttpVote, AcceptedAndRejectedBallots) {
    FakeVotingServer server;
    std::mt19937 gen(1);
    HttpVote vote(server.target());

    OperationResult accepted = vote.submit(Ballot{"VOTE_0_1700000000", "CAND_1"}, gen);
    OperationResult rejected = vote.submit(Ballot{"VOTE_4_1700000000", "CAND_5"}, gen);

    EXPECT_TRUE(accepted.ok) << accepted.detail;
    EXPECT_FALSE(rejected.ok);
    EXPECT_NE(rejected.detail.find("HTTP 409"), std::string::npos);

    auto bodies = server.bodies();
    ASSERT_EQ(bodies.size(), 2u);
    EXPECT_EQ(bodies[0], "{\"vote_id\": \"VOTE_0_1700000000\", \"candidate_id\": \"CAND_1\"}");
}
