#include "foodtrace/core/digest.hpp"

#include <memory>
#include <openssl/evp.h>

namespace foodtrace {

namespace {

struct MdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;

void putLE32(uint8_t* out, uint32_t value) {
    for (int i = 0; i < 4; ++i) {
        out[i] = static_cast<uint8_t>((value >> (i * 8)) & 0xFF);
    }
}

}  // namespace

bool chainDigest(const Digest& prev, uint32_t flags,
                 std::span<const uint8_t> payload, Digest& out) {
    MdCtxPtr ctx(EVP_MD_CTX_new());
    if (!ctx) {
        return false;
    }

    uint8_t frame[8];
    putLE32(frame, flags);
    putLE32(frame + 4, static_cast<uint32_t>(payload.size()));

    unsigned int len = 0;
    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), prev.data(), prev.size()) != 1 ||
        EVP_DigestUpdate(ctx.get(), frame, sizeof(frame)) != 1 ||
        (!payload.empty() && EVP_DigestUpdate(ctx.get(), payload.data(), payload.size()) != 1) ||
        EVP_DigestFinal_ex(ctx.get(), out.data(), &len) != 1) {
        return false;
    }

    return len == DIGEST_SIZE;
}

std::string toHex(const Digest& digest) {
    static constexpr char HEX[] = "0123456789abcdef";

    std::string result;
    result.reserve(DIGEST_SIZE * 2);
    for (uint8_t b : digest) {
        result.push_back(HEX[b >> 4]);
        result.push_back(HEX[b & 0x0F]);
    }
    return result;
}

}  // namespace foodtrace
