#pragma once

#include <atomic>
#include <functional>
#include <mutex>
#include <thread>
#include "credential_guard.hpp"

// Runs CredentialGuard::retrieve() off the calling thread and admits at most
// one request at a time, so a double click cannot put two ceremonies on
// screen. The completion runs on the worker thread; marshal it back to the
// UI thread if needed. It must not call submit() or wait() itself.
class RetrievalWorker {
public:
    using Completion = std::function<void(Result<SecretBytes, RetrieveError>)>;

    explicit RetrievalWorker(CredentialGuard& guard);
    ~RetrievalWorker();

    RetrievalWorker(const RetrievalWorker&) = delete;
    RetrievalWorker& operator=(const RetrievalWorker&) = delete;

    // Starts a retrieval. Returns false, without calling on_done, when a
    // request is already in flight.
    bool submit(Completion on_done);

    bool in_flight() const { return busy_.load(); }

    // Blocks until the current request (if any) has completed.
    void wait();

private:
    void run(Completion on_done);

    CredentialGuard& guard_;
    std::atomic<bool> busy_{false};
    std::thread thread_;
    std::mutex mutex_;
};
