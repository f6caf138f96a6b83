#include "journal/Hash.hpp"

#include "journal/Errors.hpp"

#include <openssl/evp.h>

#include <memory>
#include <new>
#include <utility>

namespace journal {

namespace {

struct DigestContextDeleter {
    void operator()(EVP_MD_CTX* context) const { EVP_MD_CTX_free(context); }
};

}  // namespace

Hash::Hash(std::string value) : m_value(std::move(value)) {
    if (!isValid(m_value)) {
        throw InvalidArgument("Invalid hash '" + m_value + "': expected 64 lowercase hex characters");
    }
}

Hash Hash::zero() {
    return Hash(std::string(kLength, '0'));
}

Hash Hash::of(std::string_view data) {
    return Hash(sha256Hex(data));
}

bool Hash::isValid(std::string_view value) {
    if (value.size() != kLength) {
        return false;
    }
    for (char c : value) {
        const bool digit = c >= '0' && c <= '9';
        const bool lower = c >= 'a' && c <= 'f';
        if (!digit && !lower) {
            return false;
        }
    }
    return true;
}

bool Hash::isZero() const {
    return m_value.find_first_not_of('0') == std::string::npos;
}

std::string sha256Hex(std::string_view input) {
    std::unique_ptr<EVP_MD_CTX, DigestContextDeleter> context(EVP_MD_CTX_new());
    if (!context) {
        throw std::bad_alloc();
    }

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digestLength = 0;
    if (EVP_DigestInit_ex(context.get(), EVP_sha256(), nullptr) != 1 ||
        EVP_DigestUpdate(context.get(), input.data(), input.size()) != 1 ||
        EVP_DigestFinal_ex(context.get(), digest, &digestLength) != 1) {
        throw StorageError("OpenSSL failed to compute a SHA-256 digest");
    }

    static const char kHexDigits[] = "0123456789abcdef";
    std::string hex;
    hex.reserve(digestLength * 2);
    for (unsigned int i = 0; i < digestLength; ++i) {
        hex.push_back(kHexDigits[digest[i] >> 4]);
        hex.push_back(kHexDigits[digest[i] & 0x0f]);
    }
    return hex;
}

}  // namespace journal
