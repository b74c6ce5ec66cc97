#include "dxfer/transfer/digest.hpp"

#include <openssl/evp.h>

#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace dxfer::transfer {

std::string to_hex(const std::uint8_t* data, std::size_t len) {
    std::ostringstream oss;
    for (std::size_t i = 0; i < len; ++i) {
        oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(data[i]);
    }
    return oss.str();
}

void Sha256Digest::CtxDeleter::operator()(evp_md_ctx_st* ctx) const noexcept {
    EVP_MD_CTX_free(ctx);
}

Sha256Digest::Sha256Digest() : ctx_(EVP_MD_CTX_new()) {
    if (!ctx_ || EVP_DigestInit_ex(ctx_.get(), EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("failed to initialise SHA-256 context");
    }
}

Sha256Digest::~Sha256Digest() = default;
Sha256Digest::Sha256Digest(Sha256Digest&&) noexcept = default;
Sha256Digest& Sha256Digest::operator=(Sha256Digest&&) noexcept = default;

void Sha256Digest::update(const std::uint8_t* data, std::size_t len) {
    if (finished_) {
        throw std::logic_error("SHA-256 digest updated after hexdigest()");
    }
    if (len == 0) {
        return;
    }
    if (EVP_DigestUpdate(ctx_.get(), data, len) != 1) {
        throw std::runtime_error("SHA-256 update failed");
    }
    bytes_hashed_ += len;
}

std::string Sha256Digest::hexdigest() {
    if (finished_) {
        throw std::logic_error("SHA-256 digest already finalised");
    }
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    if (EVP_DigestFinal_ex(ctx_.get(), digest, &digest_len) != 1 || digest_len != kDigestSize) {
        throw std::runtime_error("SHA-256 finalisation failed");
    }
    finished_ = true;
    return to_hex(digest, digest_len);
}

std::string Sha256Digest::hex_of(const std::uint8_t* data, std::size_t len) {
    Sha256Digest digest;
    digest.update(data, len);
    return digest.hexdigest();
}

} // namespace dxfer::transfer
