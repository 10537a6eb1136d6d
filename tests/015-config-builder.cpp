//
// Copyright (c) 2019-2026 Ivan Baidakou (basiliscos) (the dot dmol at gmail dot com)
//
// Distributed under the MIT Software License
//

#include "theatre.hpp"
#include "actor_test.h"
#include <catch2/catch.hpp>
#include <iostream>
#include <sstream>
#include <system_error>

namespace th = theatre;
namespace tt = theatre::test;

TEST_CASE("identity", "[config_builder]") {
    tt::journal_t<int> journal;

    SECTION("explicit") {
        auto actor = th::make_actor<int>(tt::recorder_t<int>(journal)).identity("sample").finish();
        CHECK(actor.get_identity() == "sample");
        actor.kill();
        actor.wait();
        auto reason = actor.get_shutdown_reason();
        REQUIRE(reason);
        CHECK(reason->context == "sample");
        CHECK(reason->message() == "sample normal shutdown");
    }

    SECTION("generated") {
        auto actor = th::spawn_graceful<int>(tt::recorder_t<int>(journal));
        auto other = th::spawn_graceful<int>(tt::recorder_t<int>(journal));
        CHECK(!actor.get_identity().empty());
        CHECK(actor.get_identity() != other.get_identity());
        actor.kill();
        other.kill();
        actor.wait();
        other.wait();
    }
}

TEST_CASE("mailbox tuning", "[config_builder]") {
    tt::journal_t<int> journal;
    auto actor = th::make_actor<int>(tt::recorder_t<int>(journal))
                     .inbound_queue_size(1)
                     .poll_duration(th::pt::milliseconds{1})
                     .policy(th::termination_policy_t::graceful)
                     .finish();
    for (int i = 1; i <= 1000; ++i) {
        REQUIRE(!actor.tell(i));
    }
    tt::sleep_ms(10);
    REQUIRE(!actor.tell(1001));
    actor.kill();
    actor.wait();
    CHECK(journal.get() == tt::sequence(1, 1001));
}

TEST_CASE("validation", "[config_builder]") {
    SECTION("self-terminating actor cannot be graceful") {
        auto builder = th::make_suicidal_actor<int>([](int &) { return true; });
        CHECK(builder.validate());
        auto ec = std::error_code{};
        try {
            std::move(builder).policy(th::termination_policy_t::graceful).finish();
        } catch (const std::system_error &ex) {
            ec = ex.code();
        }
        CHECK(ec == th::make_error_code(th::error_code_t::actor_misconfigured));
    }

    SECTION("immediate policy is reserved for self-terminating actor") {
        tt::journal_t<int> journal;
        auto builder = th::make_actor<int>(tt::recorder_t<int>(journal)).policy(th::termination_policy_t::immediate);
        CHECK(!builder.validate());
        auto ec = std::error_code{};
        try {
            std::move(builder).finish();
        } catch (const std::system_error &ex) {
            ec = ex.code();
        }
        CHECK(ec == th::make_error_code(th::error_code_t::actor_misconfigured));
    }

    SECTION("failure handler is mandatory") {
        tt::journal_t<int> journal;
        auto builder = th::make_actor<int>(tt::recorder_t<int>(journal)).failure_handler({});
        CHECK(!builder.validate());
        CHECK_THROWS_AS(std::move(builder).finish(), std::system_error);
    }
}

TEST_CASE("lifecycle inspection", "[config_builder]") {
    std::stringstream out;
    auto prev = std::cout.rdbuf(out.rdbuf());

    tt::journal_t<int> journal;
    auto actor = th::make_actor<int>(tt::recorder_t<int>(journal)).identity("inspected").inspect().finish();
    REQUIRE(!actor.tell(1));
    actor.kill();
    actor.wait();
    std::cout.rdbuf(prev);

    auto log = out.str();
    CHECK(log.find("[theatre] inspected: spawned") != std::string::npos);
    CHECK(log.find("[theatre] inspected: kill requested") != std::string::npos);
    CHECK(log.find("[theatre] inspected: draining (inspected normal shutdown)") != std::string::npos);
    CHECK(log.find("[theatre] inspected: dead (inspected normal shutdown)") != std::string::npos);
}
