#include "guard_events.hpp"

const char* to_string(GuardEventKind kind) {
    switch (kind) {
        case GuardEventKind::kAvailabilityProbeFailed: return "availability_probe_failed";
        case GuardEventKind::kStored:                  return "stored";
        case GuardEventKind::kStoreFailed:             return "store_failed";
        case GuardEventKind::kRetrieved:               return "retrieved";
        case GuardEventKind::kRetrieveCancelled:       return "retrieve_cancelled";
        case GuardEventKind::kRetrieveFailed:          return "retrieve_failed";
        case GuardEventKind::kDeleted:                 return "deleted";
        case GuardEventKind::kDeleteFailed:            return "delete_failed";
        case GuardEventKind::kReset:                   return "reset";
        case GuardEventKind::kCacheExpired:            return "cache_expired";
    }
    return "unknown";
}

bool is_failure(GuardEventKind kind) {
    switch (kind) {
        case GuardEventKind::kAvailabilityProbeFailed:
        case GuardEventKind::kStoreFailed:
        case GuardEventKind::kRetrieveFailed:
        case GuardEventKind::kDeleteFailed:
            return true;
        default:
            return false;
    }
}
