#pragma once

#include <FileTransferExports.h>
#include <openssl/evp.h>
#include <openssl/sha.h>

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace FileTransfer {

// Incremental SHA-256 over OpenSSL EVP.
class FileTransfer_API Sha256 {
   public:
    using result_type = std::array<uint8_t, SHA256_DIGEST_LENGTH>;

    Sha256();

    Sha256(Sha256&&) noexcept = default;
    Sha256& operator=(Sha256&&) noexcept = default;

    // Returns false if the digest context is unusable.
    bool update(const uint8_t* data, std::size_t length);

    /**
     * @brief Finishes the digest.
     *
     * The context cannot be updated afterwards.
     *
     * @return The digest, or std::nullopt if OpenSSL failed.
     */
    std::optional<result_type> finalize();

    // Lowercase hex form of finalize().
    std::optional<std::string> hexDigest();

    [[nodiscard]] std::size_t bytesHashed() const noexcept { return bytes_; }

    static std::string toHex(const result_type& digest);

    static std::optional<result_type> compute(const uint8_t* data,
                                              std::size_t length);

   private:
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx_;
    std::size_t bytes_ = 0;
    bool finalized_ = false;
};

}  // namespace FileTransfer
