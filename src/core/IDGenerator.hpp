#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <random>
#include <string>

namespace deskpool {

// Prefixed ULIDs ("sess-01J0...") for session ids.
// Crockford Base32, 48-bit millisecond timestamp + 80 random bits,
// monotonic within one millisecond.
class IDGenerator {
public:
    IDGenerator() : rng_(seeded_engine()) {}

    std::string session_id() { return "sess-" + next_ulid(); }

private:
    using Bytes = std::array<std::uint8_t, 16>;
    using u128 = unsigned __int128;

    std::string next_ulid() {
        const std::uint64_t ts = epoch_ms();

        u128 entropy;
        {
            std::lock_guard<std::mutex> lk(mu_);
            if (ts != last_ms_) {
                last_ms_ = ts;
                last_entropy_ = random80();
            } else {
                ++last_entropy_;
            }
            entropy = last_entropy_;
        }

        Bytes bytes{};
        for (int i = 5; i >= 0; --i) {
            bytes[static_cast<std::size_t>(i)] = static_cast<std::uint8_t>((ts >> (8 * (5 - i))) & 0xFF);
        }
        for (int i = 15; i >= 6; --i) {
            bytes[static_cast<std::size_t>(i)] = static_cast<std::uint8_t>(entropy & 0xFF);
            entropy >>= 8;
        }
        return encode(bytes);
    }

    u128 random80() {
        const std::uint64_t hi = rng_();
        const std::uint64_t lo = rng_() >> 48;
        return (static_cast<u128>(hi) << 16) | lo;
    }

    static std::uint64_t epoch_ms() {
        using namespace std::chrono;
        return static_cast<std::uint64_t>(
            duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count());
    }

    // 128 bits -> 26 symbols; the leading symbol carries the 2 padding bits.
    static std::string encode(const Bytes& bytes) {
        static constexpr char alphabet[] = "0123456789ABCDEFGHJKMNPQRSTVWXYZ";

        u128 value = 0;
        for (std::uint8_t b : bytes) value = (value << 8) | b;

        std::string out(26, '0');
        for (int i = 25; i >= 0; --i) {
            out[static_cast<std::size_t>(i)] = alphabet[static_cast<std::size_t>(value & 0x1F)];
            value >>= 5;
        }
        return out;
    }

    static std::mt19937_64 seeded_engine() {
        std::random_device rd;
        std::seed_seq seq{
            rd(), rd(), rd(), rd(),
            static_cast<unsigned>(std::chrono::steady_clock::now().time_since_epoch().count())
        };
        return std::mt19937_64(seq);
    }

    std::mt19937_64 rng_;
    std::mutex mu_;
    std::uint64_t last_ms_ = 0;
    u128 last_entropy_ = 0;
};

} // namespace deskpool
