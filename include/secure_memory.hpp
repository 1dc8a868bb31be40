#pragma once

#include <cstddef>
#include <cstdint>
#include <utility>
#include <vector>

#include <sodium.h>

namespace tr {

inline void secureZero(void* ptr, std::size_t numBytes) {
    if (ptr == nullptr || numBytes == 0) {
        return;
    }

    sodium_memzero(ptr, numBytes);
}

// Owns raw key bytes. Move-only, wiped on destruction and on reassignment.
class SecureKey {
public:
    SecureKey() = default;
    explicit SecureKey(std::size_t numBytes) : bytes_(numBytes) {}

    SecureKey(const SecureKey&) = delete;
    SecureKey& operator=(const SecureKey&) = delete;

    SecureKey(SecureKey&& other) noexcept : bytes_(std::move(other.bytes_)) {
        other.bytes_.clear();
    }

    SecureKey& operator=(SecureKey&& other) noexcept {
        if (this != &other) {
            wipe();
            bytes_ = std::move(other.bytes_);
            other.bytes_.clear();
        }
        return *this;
    }

    ~SecureKey() {
        wipe();
    }

    std::size_t size() const { return bytes_.size(); }
    bool empty() const { return bytes_.empty(); }

    unsigned char* data() { return bytes_.data(); }
    const unsigned char* data() const { return bytes_.data(); }

    void wipe() {
        if (!bytes_.empty()) {
            secureZero(bytes_.data(), bytes_.size());
        }
        bytes_.clear();
    }

private:
    std::vector<unsigned char> bytes_;
};

} // namespace tr
