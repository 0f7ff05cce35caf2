#pragma once

#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>

// Owned secret buffer. Move-only; contents are wiped on destruction,
// on wipe(), and when overwritten by move-assignment.
class SecretBytes {
public:
    SecretBytes() = default;
    explicit SecretBytes(std::vector<uint8_t> bytes);
    SecretBytes(const uint8_t* data, size_t len);
    ~SecretBytes();

    static SecretBytes from_string(const std::string& s);

    SecretBytes(SecretBytes&& other) noexcept;
    SecretBytes& operator=(SecretBytes&& other) noexcept;

    SecretBytes(const SecretBytes&) = delete;
    SecretBytes& operator=(const SecretBytes&) = delete;

    const uint8_t* data() const { return bytes_.data(); }
    size_t size() const { return bytes_.size(); }
    bool empty() const { return bytes_.empty(); }

    // Copies into a std::string. The caller wipes it with wipe_string().
    std::string to_string() const;

    void wipe();

    // Constant-time for equal lengths.
    bool equals(const SecretBytes& other) const;
    bool equals(const std::string& other) const;

private:
    std::vector<uint8_t> bytes_;
};

// Zero a string's buffer before it is released.
void wipe_string(std::string& s);

// Zero a byte vector's buffer and clear it.
void wipe_vector(std::vector<uint8_t>& v);
