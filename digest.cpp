#include "digest.hpp"

#include <openssl/evp.h>

#include <iostream>

namespace digest {

    bool sha256(const std::vector<uint8_t>& data,
                std::vector<uint8_t>& outDigest)
    {
        outDigest.clear();

        EVP_MD_CTX* ctx = EVP_MD_CTX_new();
        if (!ctx) {
            std::cerr << "[digest] EVP_MD_CTX_new failed\n";
            return false;
        }

        if (EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) != 1) {
            std::cerr << "[digest] EVP_DigestInit_ex failed\n";
            EVP_MD_CTX_free(ctx);
            return false;
        }

        if (!data.empty() &&
            EVP_DigestUpdate(ctx, data.data(), data.size()) != 1)
        {
            std::cerr << "[digest] EVP_DigestUpdate failed\n";
            EVP_MD_CTX_free(ctx);
            return false;
        }

        unsigned char md[EVP_MAX_MD_SIZE];
        unsigned int mdLen = 0;
        if (EVP_DigestFinal_ex(ctx, md, &mdLen) != 1) {
            std::cerr << "[digest] EVP_DigestFinal_ex failed\n";
            EVP_MD_CTX_free(ctx);
            return false;
        }

        EVP_MD_CTX_free(ctx);
        outDigest.assign(md, md + mdLen);
        return true;
    }

    bool sha256Hex(const std::vector<uint8_t>& data,
                   std::string& outHex)
    {
        outHex.clear();

        std::vector<uint8_t> md;
        if (!sha256(data, md)) {
            return false;
        }

        static const char kHex[] = "0123456789abcdef";
        outHex.reserve(md.size() * 2);
        for (uint8_t b : md) {
            outHex.push_back(kHex[b >> 4]);
            outHex.push_back(kHex[b & 0x0F]);
        }
        return true;
    }

}
