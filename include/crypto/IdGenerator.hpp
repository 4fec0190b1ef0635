#pragma once

#include <sodium.h>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace sf::crypto {

// Crockford Base32 (no I, L, O, U)
static inline constexpr char kBase32Crockford[] = "0123456789ABCDEFGHJKMNPQRSTVWXYZ";

enum class Case { Upper, Lower };

inline void ensure_sodium_init() {
    static const int init = []{
        if (sodium_init() < 0) throw std::runtime_error("libsodium init failed");
        return 1;
    }();
    (void)init;
}

inline std::string b32_crockford_encode(const uint8_t* data, const size_t len, const Case out_case = Case::Upper) {
    if (len == 0) return {};
    std::string out;
    out.reserve((len * 8 + 4) / 5);

    uint32_t buffer = 0;
    int bits = 0;

    for (size_t i = 0; i < len; ++i) {
        buffer = (buffer << 8) | data[i];
        bits += 8;
        while (bits >= 5) {
            bits -= 5;
            out.push_back(kBase32Crockford[(buffer >> bits) & 0x1F]);
        }
    }

    if (bits > 0) out.push_back(kBase32Crockford[(buffer << (5 - bits)) & 0x1F]);

    if (out_case == Case::Lower)
        std::ranges::transform(out.begin(), out.end(), out.begin(),
            [](const unsigned char c){ return static_cast<char>(std::tolower(c)); });

    return out;
}

struct IdOptions {
    std::string prefix = "t";

    // Big-endian per-generator counter ahead of the random part; ids never repeat within
    // one generator until 2^(8*sequence_bytes) ids have been issued
    size_t sequence_bytes = 5;

    // 5 + 5 bytes => 80 bits => 16 chars
    size_t random_bytes = 5;

    char separator = '_';

    Case out_case = Case::Lower;
};

class IdGenerator {
public:
    IdGenerator() : IdGenerator(IdOptions{}) {}

    explicit IdGenerator(IdOptions opt) : options_(std::move(opt)) {
        ensure_sodium_init();
        if (options_.random_bytes == 0) throw std::invalid_argument("random_bytes must be > 0");
        if (options_.sequence_bytes > 8) throw std::invalid_argument("sequence_bytes must be <= 8");
    }

    // "<prefix><sep><body>", body is Crockford Base32 of the sequence number followed by
    // random_bytes of secure randomness
    [[nodiscard]] std::string generate() const {
        std::vector<uint8_t> buf(options_.sequence_bytes + options_.random_bytes);
        const uint64_t seq = sequence_.fetch_add(1, std::memory_order_relaxed);
        for (size_t i = 0; i < options_.sequence_bytes; ++i)
            buf[i] = static_cast<uint8_t>(seq >> (8 * (options_.sequence_bytes - 1 - i)));
        randombytes_buf(buf.data() + options_.sequence_bytes, options_.random_bytes);
        const auto body = b32_crockford_encode(buf.data(), buf.size(), options_.out_case);

        if (options_.prefix.empty()) return body;

        std::string id;
        id.reserve(options_.prefix.size() + 1 + body.size());
        id.append(options_.prefix);
        id.push_back(options_.separator);
        id.append(body);
        return id;
    }

    [[nodiscard]] const IdOptions& options() const { return options_; }

private:
    IdOptions options_;
    mutable std::atomic<uint64_t> sequence_{0};
};

}
