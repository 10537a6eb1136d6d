//
// Copyright (c) 2019-2026 Ivan Baidakou (basiliscos) (the dot dmol at gmail dot com)
//
// Distributed under the MIT Software License
//

#include "theatre.hpp"
#include <catch2/catch.hpp>

namespace th = theatre;

TEST_CASE("error code messages", "[misc]") {
    CHECK(th::error_code_category().name() == std::string("theatre_error"));
    CHECK(th::error_code_category().message(-1) == "unknown");

    CHECK(th::shutdown_code_category().name() == std::string("theatre_shutdown"));
    CHECK(th::shutdown_code_category().message(-1) == "unknown shutdown reason");

    std::error_code ec = th::error_code_t::dead_actor;
    CHECK(ec);
    CHECK(ec.message() == "actor is dead");
    CHECK(ec.category() == th::error_code_category());

    std::error_code success = th::error_code_t::success;
    CHECK(success.value() == 0);
}

TEST_CASE("extended error", "[misc]") {
    auto cause = th::make_error("worker", th::error_code_t::interpreter_failure, {}, "boom");
    CHECK(cause->message() == "worker interpreter failure [boom]");
    CHECK(cause->root() == cause);

    auto error = th::make_error("sample", th::shutdown_code_t::failure_escalation, cause);
    CHECK(error->message() ==
          "sample actor shutdown due to interpreter failure <- worker interpreter failure [boom]");
    CHECK(error->root() == cause);
    CHECK(error->next == cause);
    CHECK(error->details.empty());
}
