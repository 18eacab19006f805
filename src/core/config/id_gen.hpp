#pragma once
#include <random>
#include <sstream>
#include <string>

namespace toolhub::core::config {

    // Random lowercase hex string of the given length.
    inline std::string random_hex(int length) {
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<> dis(0, 15);

        std::stringstream ss;
        for (int i = 0; i < length; ++i) {
            ss << std::hex << dis(gen);
        }
        return ss.str();
    }

    // Provider ids look like "prov-1a2b3c4d".
    inline std::string generate_provider_id() {
        return "prov-" + random_hex(8);
    }

    // Per-connection id for the event-stream push channel.
    inline std::string generate_client_id() {
        return random_hex(8) + "-" + random_hex(4) + "-" + random_hex(4) + "-" +
               random_hex(4) + "-" + random_hex(12);
    }

} // namespace toolhub::core::config
