#pragma once

#include <string>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

struct ItemConfig {
    std::string service;
    std::string account;
};

struct PromptConfig {
    std::string reason;
    std::string cancel_label;
};

struct AuthConfig {
    std::string passcode_verifier;   // empty = no passcode enrolled
    int max_attempts;
    int lockout_seconds;
};

class Config {
public:
    // Load from ~/.credguard/config.yaml. A missing file yields defaults.
    static Result<Config> load();

    // Load from an explicit path. A missing file yields defaults.
    static Result<Config> load_from(const fs::path& path);

    static Config defaults();

    // Write the whole configuration, replacing the file.
    Result<void> save_to(const fs::path& path) const;

    // Accessors
    const ItemConfig& item() const { return item_; }
    const PromptConfig& prompt() const { return prompt_; }
    const AuthConfig& auth() const { return auth_; }
    const fs::path& store_dir() const { return store_dir_; }
    const std::string& log_path() const { return log_path_; }

    void set_passcode_verifier(const std::string& verifier) { auth_.passcode_verifier = verifier; }

public:
    Config() = default;

private:
    ItemConfig item_;
    PromptConfig prompt_;
    AuthConfig auth_{};
    fs::path store_dir_;
    std::string log_path_;
};

bool config_exists();

// Get paths
fs::path get_config_dir();
fs::path get_config_path();

// Create the default config; leaves an existing file untouched.
Result<void> create_default_config();
