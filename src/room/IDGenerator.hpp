#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <random>
#include <string>
#include <string_view>

namespace nexus::room {

// Participant ids are "p-" + ULID (Crockford base32, 26 chars). ULIDs sort by
// creation time and stay unique within a millisecond (the random part is
// incremented), so an id handed out once is never produced again.
class IDGenerator {
public:
    static constexpr std::string_view kPrefix = "p-";
    static constexpr std::size_t kUlidLength = 26;

    IDGenerator() : rng_(seed_engine()) {}
    explicit IDGenerator(std::uint64_t seed) : rng_(seed) {}

    std::string participant_id() {
        return std::string(kPrefix) + next_ulid();
    }

    // Last `n` characters of the id: taken from the random part, which is what
    // distinguishes ids created in the same millisecond.
    static std::string short_tag(std::string_view id, std::size_t n = 5) {
        if (id.size() <= n) return std::string(id);
        return std::string(id.substr(id.size() - n));
    }

private:
    using u128 = unsigned __int128;
    using Bytes = std::array<std::uint8_t, 16>;

    std::string next_ulid() {
        Bytes bytes{};
        const std::uint64_t ts_ms = now_ms();

        // 48-bit big-endian timestamp.
        for (int i = 0; i < 6; ++i) {
            bytes[static_cast<std::size_t>(i)] =
                static_cast<std::uint8_t>((ts_ms >> (40 - 8 * i)) & 0xFF);
        }

        {
            std::lock_guard<std::mutex> lk(mu_);
            if (ts_ms != last_ts_ms_) {
                last_ts_ms_ = ts_ms;
                last_rand_ = random_80();
            } else {
                ++last_rand_;
            }
            write_rand_80(bytes, last_rand_);
        }

        return encode(bytes);
    }

    u128 random_80() {
        const std::uint64_t hi = dist64_(rng_) & 0xFFFF;
        const std::uint64_t lo = dist64_(rng_);
        return (static_cast<u128>(hi) << 64) | lo;
    }

    static void write_rand_80(Bytes& bytes, u128 rand80) {
        for (int i = 15; i >= 6; --i) {
            bytes[static_cast<std::size_t>(i)] = static_cast<std::uint8_t>(rand80 & 0xFF);
            rand80 >>= 8;
        }
    }

    // 128 bits -> 26 base32 chars; the leading char carries the 2 padding bits.
    static std::string encode(const Bytes& bytes) {
        static constexpr char alphabet[] = "0123456789ABCDEFGHJKMNPQRSTVWXYZ";

        u128 value = 0;
        for (std::uint8_t b : bytes) value = (value << 8) | b;

        std::string out(kUlidLength, '0');
        for (std::size_t i = kUlidLength; i-- > 0;) {
            out[i] = alphabet[static_cast<std::size_t>(value & 0x1F)];
            value >>= 5;
        }
        return out;
    }

    static std::uint64_t now_ms() {
        using namespace std::chrono;
        return static_cast<std::uint64_t>(
            duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count());
    }

    static std::mt19937_64 seed_engine() {
        std::random_device rd;
        std::seed_seq seq{
            rd(), rd(), rd(), rd(),
            static_cast<unsigned>(std::chrono::high_resolution_clock::now().time_since_epoch().count())
        };
        return std::mt19937_64(seq);
    }

    std::mt19937_64 rng_;
    std::uniform_int_distribution<std::uint64_t> dist64_{0, ~std::uint64_t(0)};

    std::mutex mu_;
    std::uint64_t last_ts_ms_ = 0;
    u128 last_rand_ = 0;
};

} // namespace nexus::room
