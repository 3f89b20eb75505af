#include <catch2/catch_test_macros.hpp>
#include "../src/error_classifier.hpp"
#include "../src/indicator_set.hpp"

namespace {

ProviderResponse response_with(long status, const nlohmann::json& body = nlohmann::json::object()) {
    ProviderResponse response;
    response.status = status;
    response.body = body;
    return response;
}

} // namespace

TEST_CASE("Provider responses are classified by status", "[errors]") {
    REQUIRE(classify(response_with(429)) == ErrorClass::THROTTLED);
    REQUIRE(classify(response_with(403)) == ErrorClass::ENTITLEMENT_DENIED);
    REQUIRE(classify(response_with(400)) == ErrorClass::MALFORMED_SYMBOL);
    REQUIRE(classify(response_with(401)) == ErrorClass::AUTH_FAILURE);
    REQUIRE(classify(response_with(500)) == ErrorClass::TRANSIENT);
    REQUIRE(classify(response_with(503)) == ErrorClass::TRANSIENT);

    SECTION("Timeouts and transport errors are transient") {
        ProviderResponse timeout;
        timeout.error = "Operation timed out after 10000 milliseconds";
        timeout.timed_out = true;
        REQUIRE(classify(timeout) == ErrorClass::TRANSIENT);
    }
}

TEST_CASE("Error policy", "[errors]") {
    SECTION("Only entitlement and malformed symbol errors blacklist") {
        REQUIRE(policy_for(ErrorClass::ENTITLEMENT_DENIED).blacklist);
        REQUIRE(policy_for(ErrorClass::MALFORMED_SYMBOL).blacklist);
        REQUIRE_FALSE(policy_for(ErrorClass::TRANSIENT).blacklist);
        REQUIRE_FALSE(policy_for(ErrorClass::THROTTLED).blacklist);
        REQUIRE_FALSE(policy_for(ErrorClass::AUTH_FAILURE).blacklist);
    }

    SECTION("Throttling engages the limiter without counting toward the breaker") {
        auto policy = policy_for(ErrorClass::THROTTLED);
        REQUIRE(policy.throttle);
        REQUIRE(policy.breaker_weight == 0);
    }

    SECTION("Auth failures use the configured weight") {
        REQUIRE(policy_for(ErrorClass::AUTH_FAILURE).breaker_weight == 2);
        REQUIRE(policy_for(ErrorClass::AUTH_FAILURE, 3).breaker_weight == 3);
    }

    SECTION("Transient errors count once") {
        REQUIRE(policy_for(ErrorClass::TRANSIENT).breaker_weight == 1);
        REQUIRE(policy_for(ErrorClass::CIRCUIT_OPEN).breaker_weight == 0);
    }
}

TEST_CASE("Bulk item error text", "[errors]") {
    REQUIRE(classify_item_errors("This symbol is not available on your plan") == ErrorClass::ENTITLEMENT_DENIED);
    REQUIRE(classify_item_errors("Invalid symbol FOO/USDT") == ErrorClass::MALFORMED_SYMBOL);
    REQUIRE(classify_item_errors("Too many requests") == ErrorClass::THROTTLED);
    REQUIRE(classify_item_errors("Unauthorized") == ErrorClass::AUTH_FAILURE);
    REQUIRE(classify_item_errors("Internal error") == ErrorClass::TRANSIENT);

    SECTION("Errors that do not reject the symbol itself never blacklist") {
        REQUIRE(classify_item_errors("Invalid interval") == ErrorClass::TRANSIENT);
        REQUIRE(classify_item_errors("Invalid period") == ErrorClass::TRANSIENT);
        REQUIRE(classify_item_errors("Error computing symbol BTC/USDT") == ErrorClass::TRANSIENT);
        REQUIRE(classify_item_errors("See explanation in docs") == ErrorClass::TRANSIENT);
    }
}

TEST_CASE("Error message extraction", "[errors]") {
    REQUIRE(extract_error_message({{"error", "Free plan"}}) == "Free plan");
    REQUIRE(extract_error_message({{"errors", nlohmann::json::array({"first", "second"})}}) == "first");
    REQUIRE(extract_error_message({{"message", "Bad request"}}) == "Bad request");
    REQUIRE(extract_error_message(nlohmann::json::object()) == "");
}

TEST_CASE("Indicator result parsing", "[indicators]") {
    const auto& specs = indicator_set::bulk_set();
    REQUIRE(specs.size() == 10);
    REQUIRE(indicator_set::essential_set().size() == 4);

    IndicatorSpec rsi{"rsi", "rsi", {{"period", 14}}};
    IndicatorSpec macd{"macd", "macd", nlohmann::json::object()};
    IndicatorSpec bbands{"bbands", "bbands", nlohmann::json::object()};

    SECTION("Single value indicators") {
        auto value = indicator_set::parse_result(rsi, {{"value", 48.2}});
        REQUIRE(value.has_value());
        REQUIRE(*value == 48.2);
    }

    SECTION("Compound indicators") {
        auto value = indicator_set::parse_result(macd,
            {{"valueMACD", 1.0}, {"valueMACDSignal", 0.5}, {"valueMACDHist", 0.5}});
        REQUIRE(value.has_value());
        REQUIRE((*value)["histogram"] == 0.5);
    }

    SECTION("Missing fields are rejected") {
        REQUIRE_FALSE(indicator_set::parse_result(rsi, {{"values", 1}}).has_value());
        REQUIRE_FALSE(indicator_set::parse_result(bbands, {{"valueUpperBand", 1.0}}).has_value());
    }
}
