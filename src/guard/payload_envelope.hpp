#pragma once

#include <core/types.hpp>
#include "secret_bytes.hpp"

// Stored payload layout:
//   [0]     version (ENVELOPE_VERSION)
//   [1..4]  secret length, big-endian u32
//   [5..]   secret bytes
SecretBytes encode_envelope(const SecretBytes& secret);

// Fails on unknown version, short header, or length mismatch.
Result<SecretBytes> decode_envelope(const SecretBytes& payload);
