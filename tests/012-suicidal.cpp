//
// Copyright (c) 2019-2026 Ivan Baidakou (basiliscos) (the dot dmol at gmail dot com)
//
// Distributed under the MIT Software License
//

#include "theatre.hpp"
#include "actor_test.h"
#include <catch2/catch.hpp>
#include <cstdint>

namespace th = theatre;
namespace tt = theatre::test;

namespace {

struct counting_interpreter_t : th::suicidal_interpreter_t<std::uint32_t> {
    explicit counting_interpreter_t(tt::journal_t<std::uint32_t> &journal_) : journal{&journal_} {}

    bool process(std::uint32_t &message) override {
        journal->push(message);
        ++count;
        return count % 2 == 0;
    }

    tt::journal_t<std::uint32_t> *journal;
    std::uint32_t count = 0;
};

} // namespace

TEST_CASE("actor kills itself", "[suicidal]") {
    tt::journal_t<std::uint32_t> journal;
    auto actor = th::spawn_suicidal<std::uint32_t>(counting_interpreter_t(journal));
    auto observer = actor;
    REQUIRE(!actor.tell(3));
    REQUIRE(!actor.tell(5));
    actor.wait();

    CHECK(journal.get() == std::vector<std::uint32_t>{3, 5});
    CHECK(observer.is_dead());
    CHECK(observer.tell(7) == th::make_error_code(th::error_code_t::dead_actor));

    auto reason = observer.get_shutdown_reason();
    REQUIRE(reason);
    CHECK(reason->ec == th::make_error_code(th::shutdown_code_t::self_terminated));
}

TEST_CASE("pending messages are discarded on self-termination", "[suicidal]") {
    tt::journal_t<int> journal;
    auto actor = th::spawn_suicidal<int>([&](int &value) {
        tt::sleep_ms(20);
        journal.push(value);
        return value < 0;
    });
    REQUIRE(!actor.tell(1));
    REQUIRE(!actor.tell(-1));
    REQUIRE(!actor.tell(2));
    REQUIRE(!actor.tell(3));
    actor.wait();

    CHECK(journal.get() == std::vector<int>{1, -1});
}

TEST_CASE("self-terminating actor can be killed", "[suicidal]") {
    tt::journal_t<int> journal;
    auto actor = th::spawn_suicidal<int>([&](int &value) {
        journal.push(value);
        return false;
    });
    REQUIRE(!actor.tell(1));
    actor.kill();
    actor.kill();
    actor.wait();

    CHECK(journal.get() == std::vector<int>{1});
    auto reason = actor.get_shutdown_reason();
    REQUIRE(reason);
    CHECK(reason->ec == th::make_error_code(th::shutdown_code_t::normal));
}
