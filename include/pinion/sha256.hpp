#pragma once

#include <pinion/result.hpp>
#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

namespace pinion {

// Streaming SHA-256 (FIPS 180-4)
class Sha256 {
public:
    Sha256();

    Sha256& update(const void* data, size_t len);
    Sha256& update(const std::string& s);

    // Lowercase hex digest. Finalizes: the object must not be fed again.
    std::string hex_digest();

    static std::string of(const std::string& input);

private:
    void compress(const uint8_t* block);

    std::array<uint32_t, 8> h_;
    std::array<uint8_t, 64> pending_;
    size_t pending_len_ = 0;
    uint64_t length_ = 0;
};

// "sha256:<hex>" of a local file, the form used in --hash= and lockfiles
Result<std::string> hash_artifact(const std::string& path);

} // namespace pinion
