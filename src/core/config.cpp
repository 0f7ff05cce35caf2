#include "config.hpp"
#include "constants.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <fstream>

bool config_exists() {
    return fs::exists(get_config_path());
}

fs::path get_config_dir() {
    return platform::home_dir() / ".credguard";
}

fs::path get_config_path() {
    return get_config_dir() / "config.yaml";
}

Config Config::defaults() {
    Config c;
    c.item_ = {DEFAULT_ITEM_SERVICE, DEFAULT_ITEM_ACCOUNT};
    c.prompt_ = {DEFAULT_PROMPT_REASON, DEFAULT_CANCEL_LABEL};
    c.auth_ = {"", DEFAULT_MAX_ATTEMPTS, DEFAULT_LOCKOUT_SECS};
    c.store_dir_ = get_config_dir() / "items";
    c.log_path_ = "";
    return c;
}

Result<Config> Config::load() {
    return load_from(get_config_path());
}

Result<Config> Config::load_from(const fs::path& path) {
    Config c = defaults();
    if (!fs::exists(path)) {
        return Result<Config>::Ok(c);
    }

    try {
        YAML::Node root = YAML::LoadFile(path.string());
        if (root.IsNull()) {
            return Result<Config>::Ok(c);
        }
        if (!root.IsMap()) {
            return Result<Config>::Err(fmt::format("{}: expected a mapping at top level", path.string()));
        }

        if (auto item = root["item"]) {
            c.item_.service = item["service"].as<std::string>(c.item_.service);
            c.item_.account = item["account"].as<std::string>(c.item_.account);
        }
        if (auto prompt = root["prompt"]) {
            c.prompt_.reason = prompt["reason"].as<std::string>(c.prompt_.reason);
            c.prompt_.cancel_label = prompt["cancel_label"].as<std::string>(c.prompt_.cancel_label);
        }
        if (auto store = root["store"]) {
            std::string dir = store["dir"].as<std::string>("");
            if (!dir.empty()) c.store_dir_ = platform::expand_user(dir);
        }
        if (auto auth = root["auth"]) {
            c.auth_.passcode_verifier = auth["passcode_verifier"].as<std::string>("");
            c.auth_.max_attempts = auth["max_attempts"].as<int>(DEFAULT_MAX_ATTEMPTS);
            c.auth_.lockout_seconds = auth["lockout_seconds"].as<int>(DEFAULT_LOCKOUT_SECS);
        }
        if (auto log = root["log"]) {
            std::string p = log["path"].as<std::string>("");
            c.log_path_ = p.empty() ? "" : platform::expand_user(p).string();
        }
    } catch (const YAML::Exception& e) {
        return Result<Config>::Err(fmt::format("Failed to parse {}: {}", path.string(), e.what()));
    }

    if (c.item_.service.empty() || c.item_.account.empty()) {
        return Result<Config>::Err(fmt::format("{}: item.service and item.account must not be empty",
                                               path.string()));
    }
    if (c.auth_.max_attempts <= 0) {
        return Result<Config>::Err(fmt::format("{}: auth.max_attempts must be positive", path.string()));
    }
    if (c.auth_.lockout_seconds < 0) {
        return Result<Config>::Err(fmt::format("{}: auth.lockout_seconds must not be negative",
                                               path.string()));
    }

    return Result<Config>::Ok(c);
}

Result<void> Config::save_to(const fs::path& path) const {
    YAML::Emitter out;
    out << YAML::BeginMap;

    out << YAML::Key << "item" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "service" << YAML::Value << item_.service;
    out << YAML::Key << "account" << YAML::Value << item_.account;
    out << YAML::EndMap;

    out << YAML::Key << "prompt" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "reason" << YAML::Value << prompt_.reason;
    out << YAML::Key << "cancel_label" << YAML::Value << prompt_.cancel_label;
    out << YAML::EndMap;

    out << YAML::Key << "store" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "dir" << YAML::Value << store_dir_.string();
    out << YAML::EndMap;

    out << YAML::Key << "auth" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "passcode_verifier" << YAML::Value << auth_.passcode_verifier;
    out << YAML::Key << "max_attempts" << YAML::Value << auth_.max_attempts;
    out << YAML::Key << "lockout_seconds" << YAML::Value << auth_.lockout_seconds;
    out << YAML::EndMap;

    out << YAML::Key << "log" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "path" << YAML::Value << log_path_;
    out << YAML::EndMap;

    out << YAML::EndMap;

    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);
    if (ec) {
        return Result<void>::Err(fmt::format("Cannot create {}: {}", path.parent_path().string(),
                                             ec.message()));
    }

    std::ofstream f(path, std::ios::trunc);
    if (!f) {
        return Result<void>::Err("Failed to open " + path.string());
    }
    if (!platform::restrict_to_owner(path)) {
        return Result<void>::Err("Failed to restrict permissions on " + path.string());
    }
    f << "# credguard configuration\n" << out.c_str() << "\n";
    if (!f) {
        return Result<void>::Err("Failed to write " + path.string());
    }
    return Result<void>::Ok();
}

Result<void> create_default_config() {
    fs::path config_path = get_config_path();

    // Don't overwrite existing config
    if (fs::exists(config_path)) {
        return Result<void>::Ok();
    }
    return Config::defaults().save_to(config_path);
}
