#include "syncpoint/common/content_hash.h"

#include <array>
#include <iomanip>
#include <memory>
#include <sstream>

#include <openssl/evp.h>

namespace syncpoint {

namespace {

constexpr size_t kReadChunkSize = 64 * 1024;

struct EvpMdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

using EvpMdCtxPtr = std::unique_ptr<EVP_MD_CTX, EvpMdCtxDeleter>;

absl::StatusOr<EvpMdCtxPtr> NewDigest() {
    EvpMdCtxPtr ctx(EVP_MD_CTX_new());
    if (!ctx) {
        return absl::InternalError("EVP_MD_CTX_new failed");
    }
    if (EVP_DigestInit_ex(ctx.get(), EVP_md5(), nullptr) != 1) {
        return absl::InternalError("EVP_DigestInit_ex failed");
    }
    return ctx;
}

absl::StatusOr<std::string> FinishDigest(EVP_MD_CTX* ctx) {
    std::array<unsigned char, EVP_MAX_MD_SIZE> out{};
    unsigned int out_len = 0;
    if (EVP_DigestFinal_ex(ctx, out.data(), &out_len) != 1) {
        return absl::InternalError("EVP_DigestFinal_ex failed");
    }

    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (unsigned int i = 0; i < out_len; ++i) {
        oss << std::setw(2) << static_cast<int>(out[i]);
    }
    return oss.str();
}

}  // namespace

absl::StatusOr<std::string> HashStream(std::istream& in) {
    auto ctx = NewDigest();
    if (!ctx.ok()) {
        return ctx.status();
    }

    std::array<char, kReadChunkSize> buffer;
    while (in.read(buffer.data(), buffer.size()) || in.gcount() > 0) {
        const auto n = static_cast<size_t>(in.gcount());
        if (EVP_DigestUpdate(ctx->get(), buffer.data(), n) != 1) {
            return absl::InternalError("EVP_DigestUpdate failed");
        }
    }
    if (in.bad()) {
        return absl::InternalError("Read error while hashing content");
    }

    return FinishDigest(ctx->get());
}

absl::StatusOr<std::string> HashBytes(std::string_view data) {
    auto ctx = NewDigest();
    if (!ctx.ok()) {
        return ctx.status();
    }
    if (EVP_DigestUpdate(ctx->get(), data.data(), data.size()) != 1) {
        return absl::InternalError("EVP_DigestUpdate failed");
    }
    return FinishDigest(ctx->get());
}

}  // namespace syncpoint
