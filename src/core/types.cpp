/// @file src/core/types.cpp
/// @brief String conversions for the shared enums.

#include "sift/types.hpp"

namespace sift {

std::string_view to_string(ListingStatus s) noexcept {
    switch (s) {
        case ListingStatus::Active:    return "active";
        case ListingStatus::Suspended: return "suspended";
        case ListingStatus::Delisted:  return "delisted";
    }
    return "unknown";
}

std::optional<ListingStatus> parse_listing_status(std::string_view s) noexcept {
    if (s.empty() || s == "active")  return ListingStatus::Active;
    if (s == "suspended")            return ListingStatus::Suspended;
    if (s == "delisted")             return ListingStatus::Delisted;
    return std::nullopt;
}

std::string_view to_string(FetchError e) noexcept {
    switch (e) {
        case FetchError::NotFound:         return "NotFound";
        case FetchError::RateLimited:      return "RateLimited";
        case FetchError::Transient:        return "Transient";
        case FetchError::MalformedPayload: return "MalformedPayload";
    }
    return "Unknown";
}

std::string_view to_string(ComputeError e) noexcept {
    switch (e) {
        case ComputeError::InsufficientHistory: return "InsufficientHistory";
    }
    return "Unknown";
}

std::string_view to_string(StoreError e) noexcept {
    switch (e) {
        case StoreError::Unavailable:         return "Unavailable";
        case StoreError::ConstraintViolation: return "ConstraintViolation";
    }
    return "Unknown";
}

std::string_view to_string(OrchestrationError e) noexcept {
    switch (e) {
        case OrchestrationError::PartialDateFailure: return "PartialDateFailure";
        case OrchestrationError::StoreCommitFailure: return "StoreCommitFailure";
    }
    return "Unknown";
}

}  // namespace sift
