// ---------------------------------------------------------------------------
// digest.cpp
//
// OpenSSL EVP 기반 SHA-256.
// EVP_MD_CTX 는 unique_ptr + 커스텀 deleter 로 관리한다 (모든 경로에서 해제 보장).
// ---------------------------------------------------------------------------

#include "common/digest.hpp"

#include <array>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>

#include <openssl/evp.h>

namespace {

struct EvpCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const noexcept { EVP_MD_CTX_free(ctx); }
};

using EvpCtxPtr = std::unique_ptr<EVP_MD_CTX, EvpCtxDeleter>;

constexpr std::array<char, 16> kHexDigits = {
    '0', '1', '2', '3', '4', '5', '6', '7',
    '8', '9', 'a', 'b', 'c', 'd', 'e', 'f',
};

}  // namespace

std::string sha256_hex(std::string_view payload) {
    EvpCtxPtr ctx{EVP_MD_CTX_new()};
    if (!ctx) {
        throw std::runtime_error("digest: EVP_MD_CTX_new failed");
    }

    std::array<unsigned char, EVP_MAX_MD_SIZE> md{};
    unsigned int md_len = 0;

    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), payload.data(), payload.size()) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), md.data(), &md_len) != 1) {
        throw std::runtime_error("digest: SHA-256 computation failed");
    }

    std::string hex;
    hex.reserve(static_cast<std::size_t>(md_len) * 2);
    for (unsigned int i = 0; i < md_len; ++i) {
        hex.push_back(kHexDigits[md[i] >> 4]);
        hex.push_back(kHexDigits[md[i] & 0x0F]);
    }
    return hex;
}
