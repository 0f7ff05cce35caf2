#include "file_secure_store.hpp"
#include "platform.hpp"
#include <core/constants.hpp>
#include <core/utils.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <fstream>
#include <system_error>

static const int ITEM_FORMAT_VERSION = 1;

// Keep one path component per field; anything outside [A-Za-z0-9._-] becomes '_'.
static std::string sanitize_component(const std::string& s) {
    if (s.empty() || s == "." || s == "..") return "_";
    std::string out = s;
    for (auto& c : out) {
        bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                  (c >= '0' && c <= '9') || c == '.' || c == '_' || c == '-';
        if (!ok) c = '_';
    }
    return out;
}

static StoreFailure failure(StoreStatus status, int code, std::string message) {
    return StoreFailure{status, code, std::move(message)};
}

static void emit_policy(YAML::Emitter& out, const AccessPolicy& policy) {
    out << YAML::Key << "policy" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "factors" << YAML::Value << YAML::Flow << YAML::BeginSeq;
    for (auto f : policy.factors) out << to_string(f);
    out << YAML::EndSeq;
    out << YAML::Key << "combinator" << YAML::Value << to_string(policy.combinator);
    out << YAML::Key << "accessibility" << YAML::Value << to_string(policy.accessibility);
    out << YAML::Key << "scope" << YAML::Value << to_string(policy.scope);
    out << YAML::EndMap;
}

static Result<AccessPolicy> parse_policy(const YAML::Node& node) {
    using R = Result<AccessPolicy>;
    if (!node || !node.IsMap()) return R::Err("missing policy");

    AccessPolicy policy;
    const auto& factors = node["factors"];
    if (!factors || !factors.IsSequence()) return R::Err("policy has no factors");
    for (const auto& f : factors) {
        auto factor = parse_auth_factor(f.as<std::string>(""));
        if (!factor) return R::Err("unknown factor '" + f.as<std::string>("") + "'");
        policy.factors.insert(*factor);
    }

    auto combinator = parse_combinator(node["combinator"].as<std::string>(""));
    auto accessibility = parse_accessibility(node["accessibility"].as<std::string>(""));
    auto scope = parse_enrollment_scope(node["scope"].as<std::string>(""));
    if (!combinator || !accessibility || !scope) return R::Err("malformed policy");

    policy.combinator = *combinator;
    policy.accessibility = *accessibility;
    policy.scope = *scope;
    return R::Ok(policy);
}

FileSecureStore::FileSecureStore(fs::path root, Authenticator& authenticator, Clock clock)
    : root_(std::move(root)), authenticator_(authenticator), clock_(std::move(clock)) {}

fs::path FileSecureStore::item_path(const StorageAddress& address) const {
    return root_ / sanitize_component(address.service()) /
           (sanitize_component(address.account()) + ".yaml");
}

bool FileSecureStore::exists(const StorageAddress& address) {
    std::error_code ec;
    return fs::is_regular_file(item_path(address), ec);
}

Result<void, StoreFailure> FileSecureStore::write(const StorageAddress& address,
                                                  const SecretBytes& payload,
                                                  const AccessPolicy& policy) {
    using R = Result<void, StoreFailure>;

    if (!policy.is_satisfiable_with(authenticator_.supported_factors())) {
        return R::Err(failure(StoreStatus::kPolicyRejected, 0,
                              "no supported factor can satisfy " + policy.describe()));
    }
    if (exists(address)) {
        // Add, never update in place.
        return R::Err(failure(StoreStatus::kOther, STORE_ERR_IO,
                              "item already exists at " + address.describe()));
    }

    std::string enrollment;
    if (policy.binds_enrollment()) enrollment = authenticator_.enrollment_id();

    std::string encoded = base64_encode(payload.data(), payload.size());

    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "version" << YAML::Value << ITEM_FORMAT_VERSION;
    out << YAML::Key << "service" << YAML::Value << address.service();
    out << YAML::Key << "account" << YAML::Value << address.account();
    out << YAML::Key << "created_at" << YAML::Value << format_iso(clock_());
    emit_policy(out, policy);
    out << YAML::Key << "enrollment" << YAML::Value << enrollment;
    out << YAML::Key << "payload" << YAML::Value << encoded;
    out << YAML::EndMap;
    wipe_string(encoded);

    fs::path path = item_path(address);
    fs::path tmp = path;
    tmp += ".tmp";

    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);
    if (ec) {
        return R::Err(failure(StoreStatus::kOther, ec.value(),
                              "cannot create " + path.parent_path().string() + ": " + ec.message()));
    }

    {
        std::ofstream f(tmp, std::ios::trunc | std::ios::binary);
        if (!f) {
            return R::Err(failure(StoreStatus::kOther, STORE_ERR_IO, "cannot open " + tmp.string()));
        }
        // Restrict before any secret bytes land on disk.
        if (!platform::restrict_to_owner(tmp)) {
            f.close();
            fs::remove(tmp, ec);
            return R::Err(failure(StoreStatus::kOther, STORE_ERR_PERMISSIONS,
                                  "cannot restrict permissions on " + tmp.string()));
        }
        f << out.c_str() << "\n";
        f.flush();
        if (!f) {
            f.close();
            fs::remove(tmp, ec);
            return R::Err(failure(StoreStatus::kOther, STORE_ERR_IO, "write failed: " + tmp.string()));
        }
    }

    fs::rename(tmp, path, ec);
    if (ec) {
        int code = ec.value();
        std::string msg = ec.message();
        fs::remove(tmp, ec);
        return R::Err(failure(StoreStatus::kOther, code, "cannot move item into place: " + msg));
    }
    return R::Ok();
}

Result<void, StoreFailure> FileSecureStore::remove(const StorageAddress& address) {
    using R = Result<void, StoreFailure>;

    std::error_code ec;
    fs::remove(item_path(address), ec);   // false without error when absent
    if (ec) {
        return R::Err(failure(StoreStatus::kOther, ec.value(),
                              "cannot delete " + item_path(address).string() + ": " + ec.message()));
    }
    return R::Ok();
}

Result<SecretBytes, StoreFailure> FileSecureStore::read(const StorageAddress& address,
                                                        const AccessPolicy& /*policy*/,
                                                        const UiPrompt& prompt) {
    using R = Result<SecretBytes, StoreFailure>;

    fs::path path = item_path(address);
    if (!exists(address)) {
        return R::Err(failure(StoreStatus::kNotFound, 0, "no item at " + address.describe()));
    }

    YAML::Node root;
    try {
        root = YAML::LoadFile(path.string());
    } catch (const YAML::Exception& e) {
        return R::Err(failure(StoreStatus::kOther, STORE_ERR_FORMAT,
                              fmt::format("unreadable item {}: {}", path.string(), e.what())));
    }
    if (!root.IsMap() || root["version"].as<int>(0) != ITEM_FORMAT_VERSION) {
        return R::Err(failure(StoreStatus::kOther, STORE_ERR_FORMAT,
                              "unsupported item format in " + path.string()));
    }

    // The policy attached at write time governs, not the caller's.
    auto stored_policy = parse_policy(root["policy"]);
    if (stored_policy.is_err()) {
        return R::Err(failure(StoreStatus::kOther, STORE_ERR_FORMAT,
                              fmt::format("{}: {}", path.string(), stored_policy.error)));
    }

    if (stored_policy.value.binds_enrollment()) {
        std::string bound = root["enrollment"].as<std::string>("");
        if (bound != authenticator_.enrollment_id()) {
            std::error_code ec;
            fs::remove(path, ec);
            return R::Err(failure(StoreStatus::kNotFound, 0,
                                  "item invalidated by biometric enrollment change"));
        }
    }

    CeremonyOutcome outcome = authenticator_.evaluate(stored_policy.value, prompt);
    switch (outcome) {
        case CeremonyOutcome::kSuccess:
            break;
        case CeremonyOutcome::kCancelled:
            return R::Err(failure(StoreStatus::kUserCancelled, 0, "authentication cancelled"));
        case CeremonyOutcome::kFailed:
            return R::Err(failure(StoreStatus::kAuthFailed, 0, "authentication failed"));
        case CeremonyOutcome::kUnavailable:
            return R::Err(failure(StoreStatus::kOther, STORE_ERR_AUTH_UNAVAILABLE,
                                  "authentication unavailable"));
    }

    std::string encoded = root["payload"].as<std::string>("");
    auto decoded = base64_decode(encoded);
    wipe_string(encoded);
    if (!decoded) {
        return R::Err(failure(StoreStatus::kOther, STORE_ERR_FORMAT,
                              "payload is not valid base64 in " + path.string()));
    }
    return R::Ok(SecretBytes(std::move(*decoded)));
}
