#pragma once

#include <tessera/result.hpp>
#include <array>
#include <cstdint>
#include <cstddef>
#include <string>
#include <string_view>

namespace tessera {

// A 32-byte SHA-256 value. This is the single content hash used for file
// blobs, directory serializations and the empty-tree constant.
struct Fingerprint {
    static constexpr size_t kSize = 32;

    std::array<uint8_t, kSize> bytes{};

    // Hash a byte sequence.
    static Fingerprint of(std::string_view data);

    // Parse a 64-character lowercase or uppercase hex string.
    static Result<Fingerprint> from_hex(std::string_view hex);

    // Build from kSize raw bytes (as found in a serialized record).
    static Fingerprint from_raw(const uint8_t* raw);

    std::string hex() const;

    bool operator==(const Fingerprint& other) const { return bytes == other.bytes; }
    bool operator!=(const Fingerprint& other) const { return bytes != other.bytes; }
    bool operator<(const Fingerprint& other) const { return bytes < other.bytes; }
};

// Streaming SHA-256 (FIPS 180-4).
class Sha256 {
public:
    Sha256();

    void update(const uint8_t* data, size_t len);
    void update(std::string_view data);

    // Produce the digest. The hasher must not be fed afterwards.
    Fingerprint finish();

private:
    void compress(const uint8_t* block);

    std::array<uint32_t, 8> h_;
    std::array<uint8_t, 64> pending_;
    size_t pending_len_ = 0;
    uint64_t message_len_ = 0;
};

} // namespace tessera
