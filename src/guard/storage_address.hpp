#pragma once

#include <string>
#include <utility>

// Identifies the one stored item. Immutable once constructed.
class StorageAddress {
public:
    StorageAddress(std::string service, std::string account)
        : service_(std::move(service)), account_(std::move(account)) {}

    const std::string& service() const { return service_; }
    const std::string& account() const { return account_; }

    std::string describe() const { return service_ + "/" + account_; }

    bool operator==(const StorageAddress& other) const {
        return service_ == other.service_ && account_ == other.account_;
    }

private:
    std::string service_;
    std::string account_;
};
