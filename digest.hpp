#ifndef DIGEST_HPP
#define DIGEST_HPP

#include <string>
#include <vector>
#include <cstdint>

namespace digest {

    // raw 32-byte SHA-256
    bool sha256(const std::vector<uint8_t>& data,
                std::vector<uint8_t>& outDigest);

    // lower-case hex (64 chars)
    bool sha256Hex(const std::vector<uint8_t>& data,
                   std::string& outHex);
}

#endif
