#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <string_view>

namespace journal {

// Hex encoded SHA-256 digest. Always 64 lowercase hex characters.
class Hash {
public:
    static constexpr std::size_t kLength = 64;

    // Throws InvalidArgument unless value is exactly 64 chars of [0-9a-f].
    explicit Hash(std::string value);

    // The "no prior version" sentinel: 64 '0' characters.
    static Hash zero();

    // SHA-256 of the given bytes.
    static Hash of(std::string_view data);

    static bool isValid(std::string_view value);

    bool isZero() const;
    const std::string& toString() const { return m_value; }

    friend bool operator==(const Hash& a, const Hash& b) { return a.m_value == b.m_value; }
    friend bool operator!=(const Hash& a, const Hash& b) { return a.m_value != b.m_value; }
    friend bool operator<(const Hash& a, const Hash& b) { return a.m_value < b.m_value; }
    friend bool operator>(const Hash& a, const Hash& b) { return b < a; }
    friend bool operator<=(const Hash& a, const Hash& b) { return !(b < a); }
    friend bool operator>=(const Hash& a, const Hash& b) { return !(a < b); }

private:
    std::string m_value;
};

// Convenience SHA-256 helper returning the raw hex string.
std::string sha256Hex(std::string_view input);

}  // namespace journal

namespace std {

template <>
struct hash<journal::Hash> {
    std::size_t operator()(const journal::Hash& h) const {
        return std::hash<std::string>()(h.toString());
    }
};

}  // namespace std
