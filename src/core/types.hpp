#pragma once

#include <string>
#include <functional>
#include <chrono>
#include <utility>

// Result type for operations that can fail.
// E defaults to a human-readable message; guard operations use typed errors.
template <typename T, typename E = std::string>
struct Result {
    bool success;
    T value;
    E error;

    static Result<T, E> Ok(T val) {
        return {true, std::move(val), E{}};
    }

    static Result<T, E> Err(E err) {
        return {false, T{}, std::move(err)};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <typename E>
struct Result<void, E> {
    bool success;
    E error;

    static Result<void, E> Ok() {
        return {true, E{}};
    }

    static Result<void, E> Err(E err) {
        return {false, std::move(err)};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Wall-clock source. Injected wherever time matters so tests can simulate it.
using TimePoint = std::chrono::system_clock::time_point;
using Clock = std::function<TimePoint()>;

inline Clock system_clock() {
    return [] { return std::chrono::system_clock::now(); };
}

// Status callback for operations
using StatusCallback = std::function<void(const std::string&)>;
