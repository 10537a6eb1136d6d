//
// Copyright (c) 2019-2026 Ivan Baidakou (basiliscos) (the dot dmol at gmail dot com)
//
// Distributed under the MIT Software License
//

#include "theatre.hpp"
#include "theatre/misc/echo.hpp"
#include "actor_test.h"
#include <catch2/catch.hpp>
#include <sstream>
#include <string>

namespace th = theatre;
namespace tt = theatre::test;

TEST_CASE("single send", "[graceful]") {
    std::stringstream out;
    auto actor = th::spawn_graceful<std::string>(th::misc::echo_t(out));
    CHECK(!actor.tell("Hello, World!"));
    actor.kill();
    actor.wait();

    CHECK(out.str() == "Hello, World!\n");
    CHECK(actor.is_dead());
    auto reason = actor.get_shutdown_reason();
    REQUIRE(reason);
    CHECK(reason->ec == th::make_error_code(th::shutdown_code_t::normal));
}

TEST_CASE("everything sent before kill is interpreted in order", "[graceful]") {
    tt::journal_t<int> journal;
    auto actor = th::spawn_graceful<int>(tt::recorder_t<int>(journal, std::chrono::milliseconds{1}));
    for (int i = 1; i <= 50; ++i) {
        REQUIRE(!actor.tell(i));
    }
    actor.kill();
    actor.wait();
    CHECK(journal.get() == tt::sequence(1, 50));
}

TEST_CASE("pending messages are drained after kill", "[graceful]") {
    tt::journal_t<int> journal;
    auto actor = th::spawn_graceful<int>([&](int &value) {
        if (value == 0) {
            tt::sleep_ms(100);
        }
        journal.push(value);
    });
    REQUIRE(!actor.tell(0));
    actor.kill();
    for (int i = 1; i <= 10; ++i) {
        REQUIRE(!actor.tell(i));
    }
    actor.wait();
    CHECK(journal.get() == tt::sequence(0, 10));
}

TEST_CASE("plain function interpreter", "[graceful]") {
    static tt::journal_t<int> journal;
    struct helper {
        static void record(int value) { journal.push(value * 2); }
    };
    auto actor = th::spawn_graceful<int>(&helper::record);
    for (int i = 1; i <= 10; ++i) {
        REQUIRE(!actor.tell(i));
    }
    actor.kill();
    actor.wait();
    auto items = journal.get();
    REQUIRE(items.size() == 10);
    CHECK(items.front() == 2);
    CHECK(items.back() == 20);
}

TEST_CASE("tell to dead actor", "[graceful]") {
    tt::journal_t<int> journal;
    auto actor = th::spawn_graceful<int>(tt::recorder_t<int>(journal));
    auto observer = actor;
    auto weak = actor.weak();
    REQUIRE(!observer.tell(1));

    actor.kill();
    actor.wait();

    auto ec = observer.tell(2);
    CHECK(ec == th::make_error_code(th::error_code_t::dead_actor));
    CHECK(ec.message() == "actor is dead");
    CHECK(weak.tell(3) == th::make_error_code(th::error_code_t::dead_actor));
    CHECK(actor.tell(4) == th::make_error_code(th::error_code_t::dead_actor));
    CHECK(journal.get() == std::vector<int>{1});
}

TEST_CASE("move-only messages", "[graceful]") {
    tt::journal_t<int> journal;
    auto actor = th::spawn_graceful<std::unique_ptr<int>>([&](std::unique_ptr<int> &value) { journal.push(*value); });
    REQUIRE(!actor.tell(std::make_unique<int>(5)));
    REQUIRE(!actor.tell(std::make_unique<int>(7)));
    actor.kill();
    actor.wait();
    CHECK(journal.get() == std::vector<int>{5, 7});
}
