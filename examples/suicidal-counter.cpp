//
// Copyright (c) 2019-2026 Ivan Baidakou (basiliscos) (the dot dmol at gmail dot com)
//
// Distributed under the MIT Software License
//

/*
 * The counter interprets messages and kills itself after each second one,
 * so only the first two messages are printed; the rest are discarded.
 */

#include "theatre.hpp"
#include <cstdint>
#include <iostream>

namespace th = theatre;

struct counter_t : th::suicidal_interpreter_t<std::uint32_t> {
    bool process(std::uint32_t &message) override {
        std::cout << "It's the nb. " << count << ", message I've received!\n  => " << message << "\n";
        ++count;
        return count % 2 == 0;
    }

    std::uint32_t count = 0;
};

int main() {
    try {
        auto actor = th::spawn_suicidal<std::uint32_t>(counter_t());
        for (std::uint32_t value : {2u, 13u, 7u, 57u}) {
            if (auto ec = actor.tell(value)) {
                std::cout << "cannot tell " << value << ": " << ec.message() << "\n";
            }
        }
        actor.wait();
        std::cout << actor.get_shutdown_reason()->message() << "\n";
    } catch (const std::exception &ex) {
        std::cout << "exception : " << ex.what();
    }
    return 0;
}
