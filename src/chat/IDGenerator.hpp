#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <random>
#include <string>

namespace quichat::chat {

// Session-scoped identifiers.
//  - instance / peer ids: "<prefix>-<ULID>", Crockford base32, 26 chars,
//    monotonic within the same millisecond.
//  - probe ids: 16 lowercase hex chars (64 random bits).
class IDGenerator {
public:
    enum class Kind { Instance, Peer };

    IDGenerator()
        : rng_(seed_engine_()) {}

    IDGenerator(const IDGenerator&) = delete;
    IDGenerator& operator=(const IDGenerator&) = delete;

    std::string make(Kind kind) {
        return std::string(prefix_of(kind)) + "-" + ulid_string_();
    }

    std::string instanceID() { return make(Kind::Instance); }
    std::string peerID()     { return make(Kind::Peer); }

    std::string probeID() {
        static constexpr char hex[] = "0123456789abcdef";

        std::uint64_t bits = 0;
        {
            std::lock_guard<std::mutex> lk(mu_);
            bits = rng_();
        }

        std::string out(16, '0');
        for (int i = 15; i >= 0; --i) {
            out[static_cast<std::size_t>(i)] = hex[bits & 0xF];
            bits >>= 4;
        }
        return out;
    }

private:
    static const char* prefix_of(Kind kind) {
        switch (kind) {
            case Kind::Instance: return "inst";
            case Kind::Peer:     return "peer";
        }
        return "id";
    }

    // 48-bit millisecond timestamp followed by 80 random bits. The random
    // part is kept as hi (16 bits) and lo (64 bits) so a same-millisecond
    // burst can increment it with a carry.
    std::string ulid_string_() {
        const std::uint64_t ts_ms = now_ms_();
        std::uint16_t hi = 0;
        std::uint64_t lo = 0;
        {
            std::lock_guard<std::mutex> lk(mu_);
            if (ts_ms != last_ts_ms_) {
                last_ts_ms_ = ts_ms;
                last_lo_ = rng_();
                last_hi_ = static_cast<std::uint16_t>(rng_() >> 48);
            } else if (++last_lo_ == 0) {
                ++last_hi_;
            }
            hi = last_hi_;
            lo = last_lo_;
        }

        std::array<std::uint8_t, 16> bytes{};
        for (int i = 0; i < 6; ++i) {
            bytes[static_cast<std::size_t>(i)] =
                static_cast<std::uint8_t>((ts_ms >> (8 * (5 - i))) & 0xFF);
        }
        bytes[6] = static_cast<std::uint8_t>(hi >> 8);
        bytes[7] = static_cast<std::uint8_t>(hi & 0xFF);
        for (int i = 0; i < 8; ++i) {
            bytes[static_cast<std::size_t>(8 + i)] =
                static_cast<std::uint8_t>((lo >> (8 * (7 - i))) & 0xFF);
        }
        return crockford_base32_(bytes);
    }

    static std::uint64_t now_ms_() {
        using namespace std::chrono;
        return static_cast<std::uint64_t>(
            duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count());
    }

    // 128 bits -> 26 chars; the leading char carries the top 3 bits.
    static std::string crockford_base32_(const std::array<std::uint8_t, 16>& bytes) {
        static constexpr char alphabet[] = "0123456789ABCDEFGHJKMNPQRSTVWXYZ";

        std::string out(26, '0');
        std::uint32_t buffer = 0;
        int bits = 2;  // two implicit zero bits pad 128 up to 130
        std::size_t pos = 0;

        for (std::uint8_t byte : bytes) {
            buffer = (buffer << 8) | byte;
            bits += 8;
            while (bits >= 5) {
                bits -= 5;
                out[pos++] = alphabet[(buffer >> bits) & 0x1F];
            }
            buffer &= (1u << bits) - 1u;
        }
        return out;
    }

    static std::mt19937_64 seed_engine_() {
        std::random_device rd;
        std::seed_seq seq{
            rd(), rd(), rd(), rd(),
            static_cast<unsigned>(std::chrono::high_resolution_clock::now().time_since_epoch().count())
        };
        return std::mt19937_64(seq);
    }

private:
    std::mt19937_64 rng_;

    std::mutex mu_;
    std::uint64_t last_ts_ms_ = 0;
    std::uint16_t last_hi_ = 0;
    std::uint64_t last_lo_ = 0;
};

} // namespace quichat::chat
