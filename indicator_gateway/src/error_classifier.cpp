#include "error_classifier.hpp"
#include "util.hpp"
#include <initializer_list>

std::string error_class_to_string(ErrorClass cls) {
    switch (cls) {
        case ErrorClass::THROTTLED: return "throttled";
        case ErrorClass::ENTITLEMENT_DENIED: return "entitlement_denied";
        case ErrorClass::MALFORMED_SYMBOL: return "malformed_symbol";
        case ErrorClass::AUTH_FAILURE: return "auth_failure";
        case ErrorClass::TRANSIENT: return "transient";
        case ErrorClass::CIRCUIT_OPEN: return "circuit_open";
    }
    return "transient";
}

ErrorClass classify(const ProviderResponse& response) {
    switch (response.status) {
        case 429: return ErrorClass::THROTTLED;
        case 403: return ErrorClass::ENTITLEMENT_DENIED;
        case 400: return ErrorClass::MALFORMED_SYMBOL;
        case 401: return ErrorClass::AUTH_FAILURE;
        default: break;
    }

    // Network failures, timeouts, 5xx and unparsable bodies
    return ErrorClass::TRANSIENT;
}

namespace {

bool contains_any(const std::string& text, std::initializer_list<const char*> phrases) {
    for (const char* phrase : phrases) {
        if (text.find(phrase) != std::string::npos) return true;
    }
    return false;
}

} // namespace

ErrorClass classify_item_errors(const std::string& error_text) {
    std::string text = util::to_upper(error_text);

    // Only explicit rejections of the symbol itself, anything vaguer stays transient
    if (contains_any(text, {"NOT AVAILABLE ON YOUR PLAN", "NOT PERMITTED ON YOUR PLAN",
                            "FREE PLAN", "UPGRADE YOUR PLAN"})) {
        return ErrorClass::ENTITLEMENT_DENIED;
    }
    if (contains_any(text, {"INVALID SYMBOL", "SYMBOL NOT FOUND", "UNKNOWN SYMBOL",
                            "SYMBOL NOT SUPPORTED"})) {
        return ErrorClass::MALFORMED_SYMBOL;
    }
    if (contains_any(text, {"RATE LIMIT", "TOO MANY"})) {
        return ErrorClass::THROTTLED;
    }
    if (contains_any(text, {"INVALID SECRET", "UNAUTHORIZED"})) {
        return ErrorClass::AUTH_FAILURE;
    }
    return ErrorClass::TRANSIENT;
}

ErrorPolicy policy_for(ErrorClass cls, int auth_failure_weight) {
    switch (cls) {
        case ErrorClass::THROTTLED:
            return ErrorPolicy{0, false, true};
        case ErrorClass::ENTITLEMENT_DENIED:
            // Counted toward the breaker and drives the blacklist
            return ErrorPolicy{1, true, false};
        case ErrorClass::MALFORMED_SYMBOL:
            return ErrorPolicy{0, true, false};
        case ErrorClass::AUTH_FAILURE:
            return ErrorPolicy{auth_failure_weight, false, false};
        case ErrorClass::TRANSIENT:
            return ErrorPolicy{1, false, false};
        case ErrorClass::CIRCUIT_OPEN:
            return ErrorPolicy{0, false, false};
    }
    return ErrorPolicy{1, false, false};
}

std::string extract_error_message(const nlohmann::json& body) {
    if (!body.is_object()) {
        return body.is_string() ? body.get<std::string>() : "";
    }

    if (body.contains("error") && body["error"].is_string()) {
        return body["error"].get<std::string>();
    }

    if (body.contains("errors") && body["errors"].is_array() && !body["errors"].empty()) {
        const auto& first = body["errors"][0];
        return first.is_string() ? first.get<std::string>() : first.dump();
    }

    if (body.contains("message") && body["message"].is_string()) {
        return body["message"].get<std::string>();
    }

    return "";
}
