#pragma once

#include <string>
#include <core/types.hpp>
#include <core/constants.hpp>

// Passcode verifiers are PBKDF2-HMAC-SHA256 digests with a random salt,
// stored as "pbkdf2-sha256$<iterations>$<salt hex>$<digest hex>".

Result<std::string> make_passcode_verifier(const std::string& passcode,
                                           int iterations = PBKDF2_ITERATIONS);

// Constant-time comparison. False for malformed verifiers.
bool check_passcode(const std::string& verifier, const std::string& passcode);

bool is_well_formed_verifier(const std::string& verifier);
