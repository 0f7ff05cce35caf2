#include <gtest/gtest.h>
#include <platform/passcode_authenticator.hpp>
#include <platform/passcode_verifier.hpp>
#include <yaml-cpp/yaml.h>
#include <sys/stat.h>
#include <unistd.h>
#include <algorithm>
#include <deque>
#include <filesystem>
#include <fstream>
#include <vector>
#include "fakes.hpp"

using namespace std::chrono_literals;

// PBKDF2 with fewer rounds to keep the suite fast. Still above OpenSSL's floor.
static const int TEST_ITERATIONS = 1000;

// ── Verifier ────────────────────────────────────────────────

TEST(PasscodeVerifier, Format) {
    auto v = make_passcode_verifier("1234", TEST_ITERATIONS);
    ASSERT_TRUE(v.is_ok()) << v.error;
    EXPECT_EQ(v.value.rfind("pbkdf2-sha256$1000$", 0), 0u);
    EXPECT_TRUE(is_well_formed_verifier(v.value));
}

TEST(PasscodeVerifier, ChecksPasscode) {
    auto v = make_passcode_verifier("correct horse", TEST_ITERATIONS);
    ASSERT_TRUE(v.is_ok()) << v.error;
    EXPECT_TRUE(check_passcode(v.value, "correct horse"));
    EXPECT_FALSE(check_passcode(v.value, "correct horsE"));
    EXPECT_FALSE(check_passcode(v.value, ""));
}

TEST(PasscodeVerifier, SaltDiffersPerVerifier) {
    auto a = make_passcode_verifier("1234", TEST_ITERATIONS);
    auto b = make_passcode_verifier("1234", TEST_ITERATIONS);
    ASSERT_TRUE(a.is_ok() && b.is_ok());
    EXPECT_NE(a.value, b.value);
}

TEST(PasscodeVerifier, RejectsEmptyPasscode) {
    EXPECT_TRUE(make_passcode_verifier("", TEST_ITERATIONS).is_err());
}

TEST(PasscodeVerifier, MalformedVerifiers) {
    EXPECT_FALSE(is_well_formed_verifier(""));
    EXPECT_FALSE(is_well_formed_verifier("plain"));
    EXPECT_FALSE(is_well_formed_verifier("md5$1000$00$00"));
    EXPECT_FALSE(is_well_formed_verifier("pbkdf2-sha256$0$00ff$00"));
    EXPECT_FALSE(check_passcode("pbkdf2-sha256$x$zz$zz", "1234"));
}

// ── Authenticator ───────────────────────────────────────────

class PasscodeAuthenticatorTest : public ::testing::Test {
protected:
    static std::string verifier;
    ManualClock clock;
    std::deque<std::optional<std::string>> inputs;
    std::vector<std::string> prompts;
    std::vector<std::string> statuses;
    UiPrompt prompt{"Access your API credentials", "Cancel"};
    AccessPolicy policy = AccessPolicy::biometric_or_passcode();

    std::filesystem::path test_dir;

    void SetUp() override {
        test_dir = std::filesystem::temp_directory_path() /
                   ("credguard_passcode_test_" + std::to_string(::getpid()));
        std::filesystem::remove_all(test_dir);
        std::filesystem::create_directories(test_dir);
    }

    void TearDown() override {
        std::filesystem::remove_all(test_dir);
    }

    static void SetUpTestSuite() {
        auto v = make_passcode_verifier("2468", TEST_ITERATIONS);
        ASSERT_TRUE(v.is_ok()) << v.error;
        verifier = v.value;
    }

    PasscodeReader reader() {
        return [this](const std::string& p) -> std::optional<std::string> {
            prompts.push_back(p);
            if (inputs.empty()) return std::nullopt;
            auto next = inputs.front();
            inputs.pop_front();
            return next;
        };
    }

    PasscodeAuthenticator make(int max_attempts = 3, int lockout = 30,
                               std::filesystem::path lockout_file = {}) {
        return PasscodeAuthenticator({verifier, max_attempts, lockout, lockout_file},
                                     reader(), clock.fn(),
                                     [this](const std::string& s) { statuses.push_back(s); });
    }
};

std::string PasscodeAuthenticatorTest::verifier;

TEST_F(PasscodeAuthenticatorTest, SupportsPasscodeOnly) {
    auto auth = make();
    EXPECT_EQ(auth.supported_factors(), FactorSet{AuthFactor::kDevicePasscode});
    EXPECT_TRUE(auth.can_evaluate(policy));
    EXPECT_FALSE(auth.can_evaluate(AccessPolicy::biometric_only()));
    EXPECT_EQ(auth.enrollment_id(), "");
}

TEST_F(PasscodeAuthenticatorTest, UnavailableWithoutVerifier) {
    PasscodeAuthenticator auth({"", 3, 30}, reader(), clock.fn());
    EXPECT_FALSE(auth.can_evaluate(policy));
    EXPECT_EQ(auth.evaluate(policy, prompt), CeremonyOutcome::kUnavailable);
    EXPECT_TRUE(prompts.empty());
}

TEST_F(PasscodeAuthenticatorTest, CorrectPasscode) {
    auto auth = make();
    inputs = {std::string("2468")};
    EXPECT_EQ(auth.evaluate(policy, prompt), CeremonyOutcome::kSuccess);
    ASSERT_EQ(prompts.size(), 1u);
    EXPECT_NE(prompts[0].find("Esc or empty Enter to Cancel"), std::string::npos);
    ASSERT_FALSE(statuses.empty());
    EXPECT_EQ(statuses[0], "Access your API credentials");
}

TEST_F(PasscodeAuthenticatorTest, RetryWithinCeremony) {
    auto auth = make();
    inputs = {std::string("0000"), std::string("2468")};
    EXPECT_EQ(auth.evaluate(policy, prompt), CeremonyOutcome::kSuccess);
    EXPECT_EQ(prompts.size(), 2u);
    EXPECT_NE(std::find(statuses.begin(), statuses.end(), "Incorrect passcode, 2 attempts left."),
              statuses.end());
}

TEST_F(PasscodeAuthenticatorTest, CancelOnEscOrEmpty) {
    auto auth = make();
    inputs = {std::nullopt};
    EXPECT_EQ(auth.evaluate(policy, prompt), CeremonyOutcome::kCancelled);

    inputs = {std::string("")};
    EXPECT_EQ(auth.evaluate(policy, prompt), CeremonyOutcome::kCancelled);
    EXPECT_FALSE(auth.is_locked_out());
}

TEST_F(PasscodeAuthenticatorTest, ExhaustingAttemptsLocksOut) {
    auto auth = make(2, 30);
    inputs = {std::string("1"), std::string("2")};
    EXPECT_EQ(auth.evaluate(policy, prompt), CeremonyOutcome::kFailed);
    EXPECT_TRUE(auth.is_locked_out());
    EXPECT_FALSE(auth.can_evaluate(policy));

    // Locked out: fails without prompting.
    prompts.clear();
    inputs = {std::string("2468")};
    EXPECT_EQ(auth.evaluate(policy, prompt), CeremonyOutcome::kFailed);
    EXPECT_TRUE(prompts.empty());
}

TEST_F(PasscodeAuthenticatorTest, LockoutExpires) {
    auto auth = make(1, 30);
    inputs = {std::string("1")};
    EXPECT_EQ(auth.evaluate(policy, prompt), CeremonyOutcome::kFailed);

    clock.advance(29s);
    EXPECT_TRUE(auth.is_locked_out());
    clock.advance(1s);
    EXPECT_FALSE(auth.is_locked_out());

    inputs = {std::string("2468")};
    EXPECT_EQ(auth.evaluate(policy, prompt), CeremonyOutcome::kSuccess);
}

TEST_F(PasscodeAuthenticatorTest, BiometricOnlyPolicyUnavailable) {
    auto auth = make();
    inputs = {std::string("2468")};
    EXPECT_EQ(auth.evaluate(AccessPolicy::biometric_only(), prompt), CeremonyOutcome::kUnavailable);
    EXPECT_TRUE(prompts.empty());
}

TEST_F(PasscodeAuthenticatorTest, MalformedVerifierTreatedAsUnset) {
    PasscodeAuthenticator auth({"pbkdf2-sha256$oops", 3, 30}, reader(), clock.fn());
    EXPECT_FALSE(auth.can_evaluate(policy));
    EXPECT_EQ(auth.evaluate(policy, prompt), CeremonyOutcome::kUnavailable);
}

// ── Persisted lockout ───────────────────────────────────────

TEST_F(PasscodeAuthenticatorTest, LockoutSurvivesNewInstance) {
    auto file = test_dir / "lockout.yaml";
    {
        auto first = make(3, 30, file);
        inputs = {std::string("1"), std::string("2"), std::string("3")};
        EXPECT_EQ(first.evaluate(policy, prompt), CeremonyOutcome::kFailed);
        EXPECT_TRUE(first.is_locked_out());
    }

    // A later process starts from the same file.
    auto second = make(3, 30, file);
    EXPECT_TRUE(second.is_locked_out());
    EXPECT_FALSE(second.can_evaluate(policy));

    prompts.clear();
    inputs = {std::string("2468")};
    EXPECT_EQ(second.evaluate(policy, prompt), CeremonyOutcome::kFailed);
    EXPECT_TRUE(prompts.empty());

    clock.advance(30s);
    EXPECT_FALSE(second.is_locked_out());
}

TEST_F(PasscodeAuthenticatorTest, LockoutFileIsOwnerOnly) {
    auto file = test_dir / "lockout.yaml";
    auto auth = make(1, 30, file);
    inputs = {std::string("1")};
    EXPECT_EQ(auth.evaluate(policy, prompt), CeremonyOutcome::kFailed);

    struct stat st{};
    ASSERT_EQ(::stat(file.c_str(), &st), 0);
    EXPECT_EQ(st.st_mode & 0777, 0600u);

    YAML::Node root = YAML::LoadFile(file.string());
    EXPECT_EQ(root["locked_until"].as<int64_t>(), 1700000000 + 30);
}

TEST_F(PasscodeAuthenticatorTest, SuccessClearsLockoutFile) {
    auto file = test_dir / "lockout.yaml";
    auto auth = make(1, 30, file);
    inputs = {std::string("1")};
    EXPECT_EQ(auth.evaluate(policy, prompt), CeremonyOutcome::kFailed);
    ASSERT_TRUE(std::filesystem::exists(file));

    clock.advance(30s);
    inputs = {std::string("2468")};
    EXPECT_EQ(auth.evaluate(policy, prompt), CeremonyOutcome::kSuccess);
    EXPECT_FALSE(std::filesystem::exists(file));
}

TEST_F(PasscodeAuthenticatorTest, UnreadableLockoutFileIgnored) {
    auto file = test_dir / "lockout.yaml";
    std::ofstream(file) << "{ not yaml: [";

    auto auth = make(3, 30, file);
    EXPECT_FALSE(auth.is_locked_out());
    inputs = {std::string("2468")};
    EXPECT_EQ(auth.evaluate(policy, prompt), CeremonyOutcome::kSuccess);
}
