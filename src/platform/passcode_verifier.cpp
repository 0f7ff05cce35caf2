#include "passcode_verifier.hpp"
#include <core/utils.hpp>
#include <guard/secret_bytes.hpp>
#include <openssl/core_names.h>
#include <openssl/crypto.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/kdf.h>
#include <openssl/obj_mac.h>
#include <openssl/params.h>
#include <openssl/rand.h>
#include <fmt/format.h>
#include <memory>
#include <sstream>
#include <vector>

static const char* VERIFIER_SCHEME = "pbkdf2-sha256";

static std::string openssl_error() {
    unsigned long err = ERR_get_error();
    if (err == 0) return "unknown OpenSSL error";
    char buf[256];
    ERR_error_string_n(err, buf, sizeof(buf));
    return buf;
}

static Result<std::vector<uint8_t>> pbkdf2_sha256(const std::string& passcode,
                                                  const std::vector<uint8_t>& salt,
                                                  int iterations) {
    using R = Result<std::vector<uint8_t>>;

    std::unique_ptr<EVP_KDF, decltype(&EVP_KDF_free)> kdf(
        EVP_KDF_fetch(nullptr, "PBKDF2", nullptr), EVP_KDF_free);
    if (!kdf) return R::Err("Failed to fetch PBKDF2: " + openssl_error());

    std::unique_ptr<EVP_KDF_CTX, decltype(&EVP_KDF_CTX_free)> kctx(
        EVP_KDF_CTX_new(kdf.get()), EVP_KDF_CTX_free);
    if (!kctx) return R::Err("Failed to create KDF context: " + openssl_error());

    unsigned int iter = static_cast<unsigned int>(iterations);
    OSSL_PARAM params[5];
    params[0] = OSSL_PARAM_construct_octet_string(
        OSSL_KDF_PARAM_PASSWORD, const_cast<char*>(passcode.data()), passcode.size());
    params[1] = OSSL_PARAM_construct_octet_string(
        OSSL_KDF_PARAM_SALT, const_cast<uint8_t*>(salt.data()), salt.size());
    params[2] = OSSL_PARAM_construct_uint(OSSL_KDF_PARAM_ITER, &iter);
    params[3] = OSSL_PARAM_construct_utf8_string(
        OSSL_KDF_PARAM_DIGEST, const_cast<char*>(SN_sha256), 0);
    params[4] = OSSL_PARAM_construct_end();

    std::vector<uint8_t> out(PBKDF2_HASH_BYTES);
    if (EVP_KDF_derive(kctx.get(), out.data(), out.size(), params) != 1) {
        return R::Err("PBKDF2 derivation failed: " + openssl_error());
    }
    return R::Ok(std::move(out));
}

namespace {

struct ParsedVerifier {
    int iterations = 0;
    std::vector<uint8_t> salt;
    std::vector<uint8_t> digest;
};

bool parse_verifier(const std::string& verifier, ParsedVerifier& out) {
    std::vector<std::string> parts;
    std::istringstream iss(verifier);
    std::string part;
    while (std::getline(iss, part, '$')) parts.push_back(part);

    if (parts.size() != 4 || parts[0] != VERIFIER_SCHEME) return false;

    out.iterations = safe_stoi(parts[1], 0);
    if (out.iterations <= 0) return false;

    auto salt = hex_decode(parts[2]);
    auto digest = hex_decode(parts[3]);
    if (!salt || salt->empty() || !digest || digest->size() != PBKDF2_HASH_BYTES) return false;

    out.salt = std::move(*salt);
    out.digest = std::move(*digest);
    return true;
}

} // namespace

Result<std::string> make_passcode_verifier(const std::string& passcode, int iterations) {
    if (passcode.empty()) {
        return Result<std::string>::Err("Passcode must not be empty");
    }
    if (iterations <= 0) iterations = PBKDF2_ITERATIONS;

    std::vector<uint8_t> salt(PBKDF2_SALT_BYTES);
    if (RAND_bytes(salt.data(), static_cast<int>(salt.size())) != 1) {
        return Result<std::string>::Err("Failed to generate salt: " + openssl_error());
    }

    auto digest = pbkdf2_sha256(passcode, salt, iterations);
    if (digest.is_err()) return Result<std::string>::Err(digest.error);

    std::string verifier = fmt::format("{}${}${}${}", VERIFIER_SCHEME, iterations,
                                       hex_encode(salt.data(), salt.size()),
                                       hex_encode(digest.value.data(), digest.value.size()));
    wipe_vector(digest.value);
    return Result<std::string>::Ok(verifier);
}

bool check_passcode(const std::string& verifier, const std::string& passcode) {
    ParsedVerifier parsed;
    if (!parse_verifier(verifier, parsed)) return false;

    auto digest = pbkdf2_sha256(passcode, parsed.salt, parsed.iterations);
    if (digest.is_err()) return false;

    bool match = CRYPTO_memcmp(digest.value.data(), parsed.digest.data(),
                               parsed.digest.size()) == 0;
    wipe_vector(digest.value);
    return match;
}

bool is_well_formed_verifier(const std::string& verifier) {
    ParsedVerifier parsed;
    return parse_verifier(verifier, parsed);
}
