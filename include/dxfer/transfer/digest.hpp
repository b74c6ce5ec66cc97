#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

// Forward declaration keeps OpenSSL headers out of public includes
struct evp_md_ctx_st;

namespace dxfer::transfer {

/**
 * @brief Incremental SHA-256 accumulator
 *
 * Fed with every payload byte in transmission order; hexdigest() produces
 * the 64-character lowercase form carried in acks. Each transfer owns its
 * own accumulator.
 */
class Sha256Digest {
public:
    static constexpr std::size_t kDigestSize = 32;

    Sha256Digest();
    ~Sha256Digest();

    Sha256Digest(const Sha256Digest&) = delete;
    Sha256Digest& operator=(const Sha256Digest&) = delete;
    Sha256Digest(Sha256Digest&&) noexcept;
    Sha256Digest& operator=(Sha256Digest&&) noexcept;

    void update(const std::uint8_t* data, std::size_t len);
    void update(const std::vector<std::uint8_t>& data) { update(data.data(), data.size()); }

    /**
     * @brief Finish the digest and return it as lowercase hex
     *
     * The accumulator is spent afterwards; further update() calls throw.
     */
    std::string hexdigest();

    [[nodiscard]] std::uint64_t bytes_hashed() const noexcept { return bytes_hashed_; }

    /// One-shot helper for tests and diagnostics
    static std::string hex_of(const std::uint8_t* data, std::size_t len);

private:
    struct CtxDeleter {
        void operator()(evp_md_ctx_st* ctx) const noexcept;
    };

    std::unique_ptr<evp_md_ctx_st, CtxDeleter> ctx_;
    std::uint64_t bytes_hashed_ = 0;
    bool finished_ = false;
};

std::string to_hex(const std::uint8_t* data, std::size_t len);

} // namespace dxfer::transfer
