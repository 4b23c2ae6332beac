#pragma once
#include <cstddef>
#include <cstdint>
#include <random>
#include <string>
#include <unistd.h>

namespace gemini_mcp::core::config {

    // Lowercase hex string of `digits` random characters.
    inline std::string generate_hex_id(const std::size_t digits) {
        static constexpr char kHex[] = "0123456789abcdef";
        std::random_device rd;
        std::mt19937_64 gen((static_cast<std::uint64_t>(rd()) << 32) ^ rd());

        std::string id;
        id.reserve(digits);
        std::uint64_t bits = 0;
        for (std::size_t i = 0; i < digits; ++i) {
            if (i % 16 == 0) {
                bits = gen();
            }
            id.push_back(kHex[bits & 0xf]);
            bits >>= 4;
        }
        return id;
    }

    // "session-<pid>-<8 hex>". The pid ties log lines to the process the
    // client spawned; the suffix keeps restarts with a reused pid apart.
    inline std::string generate_session_id() {
        return "session-" + std::to_string(::getpid()) + "-" + generate_hex_id(8);
    }

} // namespace gemini_mcp::core::config
