#include "Uuid.h"

#include <array>
#include <cstdint>
#include <random>

namespace {
    std::mt19937_64& engine() {
        thread_local std::mt19937_64 eng{ [] {
            std::random_device rd;
            std::seed_seq seq{ rd(), rd(), rd(), rd() };
            std::mt19937_64 e;
            e.seed(seq);
            return e;
        }() };
        return eng;
    }
}

namespace stroll {

    std::string GenerateUuid() {
        std::array<std::uint8_t, 16> bytes{};
        std::uint64_t hi = engine()();
        std::uint64_t lo = engine()();
        for (int i = 0; i < 8; ++i) {
            bytes[i] = static_cast<std::uint8_t>(hi >> (56 - 8 * i));
            bytes[8 + i] = static_cast<std::uint8_t>(lo >> (56 - 8 * i));
        }

        // version 4, RFC 4122 variant
        bytes[6] = static_cast<std::uint8_t>((bytes[6] & 0x0F) | 0x40);
        bytes[8] = static_cast<std::uint8_t>((bytes[8] & 0x3F) | 0x80);

        static const char* hex = "0123456789abcdef";
        std::string out;
        out.reserve(36);
        for (std::size_t i = 0; i < bytes.size(); ++i) {
            if (i == 4 || i == 6 || i == 8 || i == 10) out.push_back('-');
            out.push_back(hex[bytes[i] >> 4]);
            out.push_back(hex[bytes[i] & 0x0F]);
        }
        return out;
    }

}
