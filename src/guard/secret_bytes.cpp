#include "secret_bytes.hpp"
#include <openssl/crypto.h>

SecretBytes::SecretBytes(std::vector<uint8_t> bytes)
    : bytes_(std::move(bytes)) {}

SecretBytes::SecretBytes(const uint8_t* data, size_t len)
    : bytes_(data, data + len) {}

SecretBytes::~SecretBytes() {
    wipe();
}

SecretBytes SecretBytes::from_string(const std::string& s) {
    return SecretBytes(reinterpret_cast<const uint8_t*>(s.data()), s.size());
}

SecretBytes::SecretBytes(SecretBytes&& other) noexcept
    : bytes_(std::move(other.bytes_)) {
    other.bytes_.clear();
}

SecretBytes& SecretBytes::operator=(SecretBytes&& other) noexcept {
    if (this != &other) {
        wipe();
        bytes_ = std::move(other.bytes_);
        other.bytes_.clear();
    }
    return *this;
}

std::string SecretBytes::to_string() const {
    return std::string(reinterpret_cast<const char*>(bytes_.data()), bytes_.size());
}

void SecretBytes::wipe() {
    wipe_vector(bytes_);
}

bool SecretBytes::equals(const SecretBytes& other) const {
    if (bytes_.size() != other.bytes_.size()) return false;
    if (bytes_.empty()) return true;
    return CRYPTO_memcmp(bytes_.data(), other.bytes_.data(), bytes_.size()) == 0;
}

bool SecretBytes::equals(const std::string& other) const {
    if (bytes_.size() != other.size()) return false;
    if (bytes_.empty()) return true;
    return CRYPTO_memcmp(bytes_.data(), other.data(), bytes_.size()) == 0;
}

void wipe_string(std::string& s) {
    if (!s.empty()) OPENSSL_cleanse(&s[0], s.size());
    s.clear();
}

void wipe_vector(std::vector<uint8_t>& v) {
    if (!v.empty()) OPENSSL_cleanse(v.data(), v.size());
    v.clear();
}
