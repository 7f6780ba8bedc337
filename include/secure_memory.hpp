#pragma once

#include <cstddef>
#include <string>
#include <utility>

#include <sodium.h>

namespace pfv {

inline void secureZero(void* ptr, std::size_t numBytes) {
    if (ptr == nullptr || numBytes == 0) {
        return;
    }

    sodium_memzero(ptr, numBytes);
}

// Zeroes the characters of a string holding seed material, then empties it.
inline void wipe(std::string& value) {
    if (value.empty()) {
        return;
    }
    secureZero(&value[0], value.size());
    value.clear();
}

// Holds a copy of a secret string and wipes it when the scope ends.
class ScopedSecret {
public:
    explicit ScopedSecret(std::string value) : value_(std::move(value)) {}

    ScopedSecret(const ScopedSecret&) = delete;
    ScopedSecret& operator=(const ScopedSecret&) = delete;

    ~ScopedSecret() { wipe(value_); }

    const std::string& get() const { return value_; }

private:
    std::string value_;
};

} // namespace pfv
