//
// Copyright (c) 2019-2026 Ivan Baidakou (basiliscos) (the dot dmol at gmail dot com)
//
// Distributed under the MIT Software License
//

/*
 * Spawns graceful and disgraceful echo actors, sends them a few messages and
 * kills them. The graceful one prints every message, the disgraceful one
 * might skip the messages sent after kill.
 *
 * Set THEATRE_INSPECT_LIFECYCLE=1 to see actor lifecycle transitions.
 */

#include "theatre.hpp"
#include "theatre/misc/echo.hpp"
#include <boost/lexical_cast.hpp>
#include <chrono>
#include <iostream>
#include <string>
#include <thread>

namespace th = theatre;

int main(int argc, char **argv) {
    try {
        using boost::conversion::try_lexical_convert;
        int count = 10;
        if (argc > 1) {
            try_lexical_convert(argv[1], count);
        }

        auto graceful = th::make_actor<std::string>(th::misc::echo_t()).identity("graceful").finish();
        if (auto ec = graceful.tell("Hello, World!")) {
            std::cout << "cannot tell: " << ec.message() << "\n";
        }
        graceful.kill();
        graceful.wait();

        auto disgraceful = th::spawn_disgraceful<int>(th::misc::echo_t());
        if (auto ec = disgraceful.tell(0)) {
            std::cout << "cannot tell: " << ec.message() << "\n";
        }
        std::this_thread::sleep_for(std::chrono::milliseconds{200});
        disgraceful.kill();
        for (int i = 1; i <= count; ++i) {
            if (auto ec = disgraceful.tell(i)) {
                std::cout << "message " << i << " is rejected: " << ec.message() << "\n";
            }
        }
        disgraceful.wait();
        std::cout << "disgraceful actor: " << disgraceful.get_shutdown_reason()->message() << "\n";
    } catch (const std::exception &ex) {
        std::cout << "exception : " << ex.what();
    }

    std::cout << "exiting...\n";
    return 0;
}
