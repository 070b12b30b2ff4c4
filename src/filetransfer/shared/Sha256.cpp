#include "Sha256.hpp"

#include <LogCompat.hpp>
#include <absl/strings/escaping.h>
#include <absl/strings/string_view.h>

namespace FileTransfer {

Sha256::Sha256() : ctx_(EVP_MD_CTX_new(), &EVP_MD_CTX_free) {
    if (ctx_ == nullptr) {
        LOG(ERROR) << "Failed to create EVP_MD_CTX";
        return;
    }
    if (EVP_DigestInit_ex(ctx_.get(), EVP_sha256(), nullptr) == 0) {
        LOG(ERROR) << "Failed to initialize SHA-256 digest";
        ctx_.reset();
    }
}

bool Sha256::update(const uint8_t* data, const std::size_t length) {
    if (ctx_ == nullptr || finalized_) {
        LOG(ERROR) << "SHA-256 context is not usable";
        return false;
    }
    if (length == 0) {
        return true;
    }
    if (EVP_DigestUpdate(ctx_.get(), data, length) == 0) {
        LOG(ERROR) << "EVP_DigestUpdate failed";
        return false;
    }
    bytes_ += length;
    return true;
}

std::optional<Sha256::result_type> Sha256::finalize() {
    if (ctx_ == nullptr || finalized_) {
        LOG(ERROR) << "SHA-256 context is not usable";
        return std::nullopt;
    }
    result_type digest{};
    unsigned int len = 0;
    finalized_ = true;
    if (EVP_DigestFinal_ex(ctx_.get(), digest.data(), &len) == 0 ||
        len != digest.size()) {
        LOG(ERROR) << "EVP_DigestFinal_ex failed";
        return std::nullopt;
    }
    return digest;
}

std::optional<std::string> Sha256::hexDigest() {
    const auto digest = finalize();
    if (!digest) {
        return std::nullopt;
    }
    return toHex(*digest);
}

std::string Sha256::toHex(const result_type& digest) {
    return absl::BytesToHexString(absl::string_view(
        reinterpret_cast<const char*>(digest.data()), digest.size()));
}

std::optional<Sha256::result_type> Sha256::compute(const uint8_t* data,
                                                   const std::size_t length) {
    Sha256 hasher;
    if (!hasher.update(data, length)) {
        return std::nullopt;
    }
    return hasher.finalize();
}

}  // namespace FileTransfer
