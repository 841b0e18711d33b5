#include "mediapush/crypto/digest.hpp"
#include <openssl/evp.h>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace mediapush::crypto {

struct Md5Hasher::Impl {
    EVP_MD_CTX* context = nullptr;
    
    ~Impl() {
        if (context) {
            EVP_MD_CTX_free(context);
        }
    }
};

Md5Hasher::Md5Hasher()
    : impl_(std::make_unique<Impl>())
    , finalized_(false) {
    impl_->context = EVP_MD_CTX_new();
    if (!impl_->context || EVP_DigestInit_ex(impl_->context, EVP_md5(), nullptr) != 1) {
        throw std::runtime_error("Failed to initialize MD5 digest");
    }
}

Md5Hasher::~Md5Hasher() = default;

CryptoResult Md5Hasher::update(std::span<const std::uint8_t> data) {
    if (finalized_) {
        return CryptoResult(CryptoError::INVALID_STATE, "Hasher already finalized");
    }
    
    if (EVP_DigestUpdate(impl_->context, data.data(), data.size()) != 1) {
        return CryptoResult(CryptoError::DIGEST_FAILED, "Failed to update MD5 digest");
    }
    
    return CryptoResult();
}

Md5Digest Md5Hasher::finalize() {
    if (finalized_) {
        throw std::runtime_error("Hasher already finalized");
    }
    
    Md5Digest result{};
    unsigned int length = 0;
    if (EVP_DigestFinal_ex(impl_->context, result.data(), &length) != 1 || length != MD5_DIGEST_SIZE) {
        throw std::runtime_error("Failed to finalize MD5 digest");
    }
    
    finalized_ = true;
    return result;
}

Md5Digest Md5Hasher::hash(std::span<const std::uint8_t> data) {
    Md5Hasher hasher;
    auto result = hasher.update(data);
    if (!result.success()) {
        throw std::runtime_error(result.message);
    }
    return hasher.finalize();
}

namespace digest_utils {

std::string to_hex(std::span<const std::uint8_t> bytes) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (auto byte : bytes) {
        oss << std::setw(2) << static_cast<unsigned>(byte);
    }
    return oss.str();
}

}

}
