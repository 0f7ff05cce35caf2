#pragma once

#include <gtest/gtest.h>
#include <guard/authenticator.hpp>
#include <guard/guard_events.hpp>
#include <guard/secure_store.hpp>
#include <chrono>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

// Simulated wall clock.
struct ManualClock {
    TimePoint now = TimePoint(std::chrono::seconds(1700000000));

    Clock fn() {
        return [this] { return now; };
    }
    void advance(std::chrono::seconds s) { now += s; }
};

// Scripted authenticator. Outcomes are consumed in order; when the script
// runs out, default_outcome is returned.
class FakeAuthenticator : public Authenticator {
public:
    FactorSet supported = {AuthFactor::kBiometric, AuthFactor::kDevicePasscode};
    bool available = true;
    std::string enrollment = "enrollment-1";
    std::deque<CeremonyOutcome> script;
    CeremonyOutcome default_outcome = CeremonyOutcome::kSuccess;

    int can_evaluate_calls = 0;
    int evaluate_calls = 0;

    FactorSet supported_factors() const override { return supported; }

    bool can_evaluate(const AccessPolicy&) override {
        can_evaluate_calls++;
        return available;
    }

    CeremonyOutcome evaluate(const AccessPolicy&, const UiPrompt& prompt) override {
        evaluate_calls++;
        last_prompt = prompt;
        if (script.empty()) return default_outcome;
        auto o = script.front();
        script.pop_front();
        return o;
    }

    std::string enrollment_id() const override { return enrollment; }

    UiPrompt last_prompt;
};

// Fails the test on any use.
class TripwireAuthenticator : public Authenticator {
public:
    FactorSet supported_factors() const override {
        ADD_FAILURE() << "authenticator queried for supported factors";
        return {};
    }
    bool can_evaluate(const AccessPolicy&) override {
        ADD_FAILURE() << "authenticator queried for availability";
        return false;
    }
    CeremonyOutcome evaluate(const AccessPolicy&, const UiPrompt&) override {
        ADD_FAILURE() << "authenticator asked to run a ceremony";
        return CeremonyOutcome::kFailed;
    }
    std::string enrollment_id() const override {
        ADD_FAILURE() << "authenticator queried for enrollment";
        return "";
    }
};

// In-memory store that, like a platform keychain, runs one ceremony per read
// through its authenticator.
class FakeSecureStore : public SecureStore {
public:
    explicit FakeSecureStore(Authenticator& auth) : auth_(auth) {}

    struct Item {
        std::vector<uint8_t> payload;
        AccessPolicy policy;
    };

    std::map<std::string, Item> items;
    std::optional<StoreFailure> fail_write;
    std::optional<StoreFailure> fail_remove;
    std::optional<StoreFailure> fail_read;
    bool reject_policies = false;

    int exists_calls = 0;
    int write_calls = 0;
    int remove_calls = 0;
    int read_calls = 0;

    static std::string key(const StorageAddress& a) { return a.service() + "\n" + a.account(); }

    bool exists(const StorageAddress& address) override {
        exists_calls++;
        return items.count(key(address)) > 0;
    }

    Result<void, StoreFailure> write(const StorageAddress& address,
                                     const SecretBytes& payload,
                                     const AccessPolicy& policy) override {
        write_calls++;
        if (reject_policies) {
            return Result<void, StoreFailure>::Err({StoreStatus::kPolicyRejected, -25293, "no biometry"});
        }
        if (fail_write) return Result<void, StoreFailure>::Err(*fail_write);
        if (items.count(key(address))) {
            return Result<void, StoreFailure>::Err({StoreStatus::kOther, -25299, "duplicate item"});
        }
        items[key(address)] = {std::vector<uint8_t>(payload.data(), payload.data() + payload.size()),
                               policy};
        return Result<void, StoreFailure>::Ok();
    }

    Result<void, StoreFailure> remove(const StorageAddress& address) override {
        remove_calls++;
        if (fail_remove) return Result<void, StoreFailure>::Err(*fail_remove);
        items.erase(key(address));
        return Result<void, StoreFailure>::Ok();
    }

    Result<SecretBytes, StoreFailure> read(const StorageAddress& address,
                                           const AccessPolicy& policy,
                                           const UiPrompt& prompt) override {
        using R = Result<SecretBytes, StoreFailure>;
        read_calls++;
        last_read_policy = policy;
        if (fail_read) return R::Err(*fail_read);

        auto it = items.find(key(address));
        if (it == items.end()) return R::Err({StoreStatus::kNotFound, -25300, ""});

        switch (auth_.evaluate(it->second.policy, prompt)) {
            case CeremonyOutcome::kSuccess:     break;
            case CeremonyOutcome::kCancelled:   return R::Err({StoreStatus::kUserCancelled, -128, ""});
            case CeremonyOutcome::kFailed:      return R::Err({StoreStatus::kAuthFailed, -25293, ""});
            case CeremonyOutcome::kUnavailable: return R::Err({StoreStatus::kOther, -25308, ""});
        }
        return R::Ok(SecretBytes(it->second.payload));
    }

    // Overwrites the stored payload bytes directly, bypassing the envelope.
    void corrupt(const StorageAddress& address, std::vector<uint8_t> bytes) {
        items[key(address)].payload = std::move(bytes);
    }

    // Policy the caller passed to the latest read().
    AccessPolicy last_read_policy;

private:
    Authenticator& auth_;
};

// Collects guard events.
class RecordingObserver : public GuardObserver {
public:
    void on_event(const GuardEvent& event) override {
        std::lock_guard<std::mutex> lock(mutex_);
        events.push_back(event);
    }

    bool saw(GuardEventKind kind) const {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& e : events)
            if (e.kind == kind) return true;
        return false;
    }

    std::vector<GuardEvent> events;

private:
    mutable std::mutex mutex_;
};
