#include <gtest/gtest.h>
#include <guard/retrieval_worker.hpp>
#include <condition_variable>
#include <future>
#include <mutex>
#include <stdexcept>
#include "fakes.hpp"

// Authenticator whose ceremony blocks until released.
class GatedAuthenticator : public FakeAuthenticator {
public:
    CeremonyOutcome evaluate(const AccessPolicy& policy, const UiPrompt& prompt) override {
        std::unique_lock<std::mutex> lock(mutex_);
        entered_ = true;
        cv_.notify_all();
        cv_.wait(lock, [this] { return released_; });
        return FakeAuthenticator::evaluate(policy, prompt);
    }

    void wait_entered() {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return entered_; });
    }

    void release() {
        std::lock_guard<std::mutex> lock(mutex_);
        released_ = true;
        cv_.notify_all();
    }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    bool entered_ = false;
    bool released_ = false;
};

class RetrievalWorkerTest : public ::testing::Test {
protected:
    ManualClock clock;
    GatedAuthenticator auth;
    FakeSecureStore store{auth};
    StorageAddress address{"svc", "acct"};
    UiPrompt prompt{"Access your API credentials", "Cancel"};
};

TEST_F(RetrievalWorkerTest, DeliversResult) {
    CredentialGuard guard(store, auth, address, prompt, clock.fn());
    ASSERT_TRUE(guard.store(SecretBytes::from_string("tok")).is_ok());
    auth.release();

    RetrievalWorker worker(guard);
    std::promise<bool> got;
    ASSERT_TRUE(worker.submit([&](Result<SecretBytes, RetrieveError> r) {
        got.set_value(r.is_ok() && r.value.equals(std::string("tok")));
    }));
    EXPECT_TRUE(got.get_future().get());
    worker.wait();
    EXPECT_FALSE(worker.in_flight());
}

TEST_F(RetrievalWorkerTest, RejectsSecondRequestWhileInFlight) {
    CredentialGuard guard(store, auth, address, prompt, clock.fn());
    ASSERT_TRUE(guard.store(SecretBytes::from_string("tok")).is_ok());

    RetrievalWorker worker(guard);
    int completions = 0;
    ASSERT_TRUE(worker.submit([&](Result<SecretBytes, RetrieveError>) { completions++; }));
    auth.wait_entered();

    EXPECT_TRUE(worker.in_flight());
    EXPECT_FALSE(worker.submit([&](Result<SecretBytes, RetrieveError>) { completions++; }));

    auth.release();
    worker.wait();
    EXPECT_EQ(completions, 1);
    EXPECT_EQ(auth.evaluate_calls, 1);
}

TEST_F(RetrievalWorkerTest, AcceptsNewRequestAfterCompletion) {
    CredentialGuard guard(store, auth, address, prompt, clock.fn());
    auth.release();

    RetrievalWorker worker(guard);
    std::promise<RetrieveErrorKind> first;
    ASSERT_TRUE(worker.submit([&](Result<SecretBytes, RetrieveError> r) {
        first.set_value(r.error.kind);
    }));
    EXPECT_EQ(first.get_future().get(), RetrieveErrorKind::kNotFound);
    worker.wait();

    ASSERT_TRUE(guard.store(SecretBytes::from_string("tok")).is_ok());
    std::promise<bool> second;
    ASSERT_TRUE(worker.submit([&](Result<SecretBytes, RetrieveError> r) {
        second.set_value(r.is_ok());
    }));
    EXPECT_TRUE(second.get_future().get());
    worker.wait();
}

TEST_F(RetrievalWorkerTest, ThrowingStoreReportsStorageError) {
    class ThrowingStore : public FakeSecureStore {
    public:
        using FakeSecureStore::FakeSecureStore;
        Result<SecretBytes, StoreFailure> read(const StorageAddress&, const AccessPolicy&,
                                               const UiPrompt&) override {
            throw std::runtime_error("backend exploded");
        }
    } throwing{auth};
    CredentialGuard guard(throwing, auth, address, prompt, clock.fn());
    ASSERT_TRUE(guard.store(SecretBytes::from_string("tok")).is_ok());
    auth.release();

    RetrievalWorker worker(guard);
    std::promise<RetrieveError> failed;
    ASSERT_TRUE(worker.submit([&](Result<SecretBytes, RetrieveError> r) {
        failed.set_value(r.error);
    }));
    auto error = failed.get_future().get();
    worker.wait();

    EXPECT_EQ(error.kind, RetrieveErrorKind::kStorageError);
    EXPECT_NE(error.message.find("backend exploded"), std::string::npos);
    EXPECT_FALSE(worker.in_flight());

    // The worker stays usable.
    std::promise<bool> again;
    ASSERT_TRUE(worker.submit([&](Result<SecretBytes, RetrieveError> r) {
        again.set_value(r.is_err());
    }));
    EXPECT_TRUE(again.get_future().get());
    worker.wait();
}

TEST_F(RetrievalWorkerTest, ThrowingCompletionLeavesWorkerIdle) {
    CredentialGuard guard(store, auth, address, prompt, clock.fn());
    auth.release();

    RetrievalWorker worker(guard);
    ASSERT_TRUE(worker.submit([](Result<SecretBytes, RetrieveError>) {
        throw std::runtime_error("ui gone");
    }));
    worker.wait();
    EXPECT_FALSE(worker.in_flight());
}
