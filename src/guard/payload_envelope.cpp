#include "payload_envelope.hpp"
#include <core/constants.hpp>
#include <fmt/format.h>
#include <vector>

SecretBytes encode_envelope(const SecretBytes& secret) {
    std::vector<uint8_t> out;
    out.reserve(ENVELOPE_HEADER_BYTES + secret.size());

    auto len = static_cast<uint32_t>(secret.size());
    out.push_back(ENVELOPE_VERSION);
    out.push_back(static_cast<uint8_t>((len >> 24) & 0xFF));
    out.push_back(static_cast<uint8_t>((len >> 16) & 0xFF));
    out.push_back(static_cast<uint8_t>((len >> 8) & 0xFF));
    out.push_back(static_cast<uint8_t>(len & 0xFF));
    out.insert(out.end(), secret.data(), secret.data() + secret.size());

    return SecretBytes(std::move(out));
}

Result<SecretBytes> decode_envelope(const SecretBytes& payload) {
    if (payload.size() < static_cast<size_t>(ENVELOPE_HEADER_BYTES)) {
        return Result<SecretBytes>::Err(
            fmt::format("payload too short ({} bytes)", payload.size()));
    }

    const uint8_t* p = payload.data();
    if (p[0] != ENVELOPE_VERSION) {
        return Result<SecretBytes>::Err(
            fmt::format("unknown payload version {}", static_cast<int>(p[0])));
    }

    uint32_t len = (static_cast<uint32_t>(p[1]) << 24) |
                   (static_cast<uint32_t>(p[2]) << 16) |
                   (static_cast<uint32_t>(p[3]) << 8) |
                    static_cast<uint32_t>(p[4]);

    size_t body = payload.size() - ENVELOPE_HEADER_BYTES;
    if (len != body) {
        return Result<SecretBytes>::Err(
            fmt::format("payload length mismatch (header {}, body {})", len, body));
    }

    return Result<SecretBytes>::Ok(SecretBytes(p + ENVELOPE_HEADER_BYTES, body));
}
