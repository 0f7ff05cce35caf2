#include "retrieval_worker.hpp"
#include <core/log.hpp>
#include <fmt/format.h>

RetrievalWorker::RetrievalWorker(CredentialGuard& guard)
    : guard_(guard) {}

RetrievalWorker::~RetrievalWorker() {
    wait();
}

bool RetrievalWorker::submit(Completion on_done) {
    bool expected = false;
    if (!busy_.compare_exchange_strong(expected, true)) {
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    // The previous thread has finished its work (busy_ was false) but may
    // not have been joined yet.
    if (thread_.joinable()) thread_.join();
    thread_ = std::thread(&RetrievalWorker::run, this, std::move(on_done));
    return true;
}

void RetrievalWorker::wait() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (thread_.joinable()) thread_.join();
}

void RetrievalWorker::run(Completion on_done) {
    using R = Result<SecretBytes, RetrieveError>;

    R result = R::Err({RetrieveErrorKind::kStorageError, 0, "retrieval did not run"});
    try {
        result = guard_.retrieve();
    } catch (const std::exception& e) {
        // Anything thrown on this thread becomes a storage error.
        credguard_log("error", fmt::format("retrieve threw: {}", e.what()));
        result = R::Err({RetrieveErrorKind::kStorageError, 0, e.what()});
    }

    if (on_done) {
        try {
            on_done(std::move(result));
        } catch (const std::exception& e) {
            credguard_log("error", fmt::format("retrieval completion threw: {}", e.what()));
        }
    }
    busy_.store(false);
}
