#pragma once

#include "indicator_provider.hpp"
#include <string>

enum class ErrorClass {
    THROTTLED,
    ENTITLEMENT_DENIED,
    MALFORMED_SYMBOL,
    AUTH_FAILURE,
    TRANSIENT,
    CIRCUIT_OPEN
};

struct ErrorPolicy {
    int breaker_weight;
    bool blacklist;
    bool throttle;
};

std::string error_class_to_string(ErrorClass cls);

// Maps a failed provider response onto the error taxonomy
ErrorClass classify(const ProviderResponse& response);

// Classifies the per-item error text a bulk response attaches to a result
ErrorClass classify_item_errors(const std::string& error_text);

ErrorPolicy policy_for(ErrorClass cls, int auth_failure_weight = 2);

// Pulls the human readable error out of a provider error payload
std::string extract_error_message(const nlohmann::json& body);
