#include <gtest/gtest.h>
#include <core/config.hpp>
#include <core/constants.hpp>
#include <sys/stat.h>
#include <unistd.h>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

class ConfigTest : public ::testing::Test {
protected:
    fs::path test_dir;

    void SetUp() override {
        test_dir = fs::temp_directory_path() /
                   ("credguard_config_test_" + std::to_string(::getpid()));
        fs::remove_all(test_dir);
        fs::create_directories(test_dir);
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }

    fs::path write_config(const std::string& content) {
        auto path = test_dir / "config.yaml";
        std::ofstream(path) << content;
        return path;
    }
};

TEST_F(ConfigTest, MissingFileYieldsDefaults) {
    auto r = Config::load_from(test_dir / "nope.yaml");
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.item().service, DEFAULT_ITEM_SERVICE);
    EXPECT_EQ(r.value.item().account, DEFAULT_ITEM_ACCOUNT);
    EXPECT_EQ(r.value.prompt().reason, DEFAULT_PROMPT_REASON);
    EXPECT_EQ(r.value.prompt().cancel_label, DEFAULT_CANCEL_LABEL);
    EXPECT_EQ(r.value.auth().max_attempts, DEFAULT_MAX_ATTEMPTS);
    EXPECT_EQ(r.value.auth().lockout_seconds, DEFAULT_LOCKOUT_SECS);
    EXPECT_TRUE(r.value.auth().passcode_verifier.empty());
    EXPECT_TRUE(r.value.log_path().empty());
}

TEST_F(ConfigTest, EmptyFileYieldsDefaults) {
    auto r = Config::load_from(write_config(""));
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.item().service, DEFAULT_ITEM_SERVICE);
}

TEST_F(ConfigTest, Overrides) {
    auto r = Config::load_from(write_config(
        "item:\n"
        "  service: my-app\n"
        "  account: deploy-key\n"
        "prompt:\n"
        "  reason: Unlock deploy key\n"
        "  cancel_label: Not now\n"
        "store:\n"
        "  dir: " + (test_dir / "items").string() + "\n"
        "auth:\n"
        "  max_attempts: 5\n"
        "  lockout_seconds: 0\n"));
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.item().service, "my-app");
    EXPECT_EQ(r.value.item().account, "deploy-key");
    EXPECT_EQ(r.value.prompt().reason, "Unlock deploy key");
    EXPECT_EQ(r.value.prompt().cancel_label, "Not now");
    EXPECT_EQ(r.value.store_dir(), test_dir / "items");
    EXPECT_EQ(r.value.auth().max_attempts, 5);
    EXPECT_EQ(r.value.auth().lockout_seconds, 0);
}

TEST_F(ConfigTest, PartialSectionKeepsDefaults) {
    auto r = Config::load_from(write_config("item:\n  account: other\n"));
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.item().service, DEFAULT_ITEM_SERVICE);
    EXPECT_EQ(r.value.item().account, "other");
}

TEST_F(ConfigTest, RejectsEmptyAddress) {
    EXPECT_TRUE(Config::load_from(write_config("item:\n  service: \"\"\n")).is_err());
}

TEST_F(ConfigTest, RejectsBadAttempts) {
    EXPECT_TRUE(Config::load_from(write_config("auth:\n  max_attempts: 0\n")).is_err());
    EXPECT_TRUE(Config::load_from(write_config("auth:\n  lockout_seconds: -1\n")).is_err());
}

TEST_F(ConfigTest, RejectsNonMapping) {
    auto r = Config::load_from(write_config("- a\n- b\n"));
    ASSERT_TRUE(r.is_err());
    EXPECT_NE(r.error.find("mapping"), std::string::npos);
}

TEST_F(ConfigTest, RejectsBrokenYaml) {
    EXPECT_TRUE(Config::load_from(write_config("item: [unclosed\n")).is_err());
}

TEST_F(ConfigTest, SaveAndReload) {
    auto path = test_dir / "sub" / "config.yaml";
    Config c = Config::defaults();
    c.set_passcode_verifier("pbkdf2-sha256$1000$00ff$abcd");
    ASSERT_TRUE(c.save_to(path).is_ok());

    struct stat st{};
    ASSERT_EQ(::stat(path.c_str(), &st), 0);
    EXPECT_EQ(st.st_mode & 0777, 0600u);

    auto r = Config::load_from(path);
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.auth().passcode_verifier, "pbkdf2-sha256$1000$00ff$abcd");
    EXPECT_EQ(r.value.item().service, c.item().service);
    EXPECT_EQ(r.value.store_dir(), c.store_dir());
}
