#include "batch_aggregator.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <map>

namespace {

struct SymbolAccumulator {
    nlohmann::json values = nlohmann::json::object();
    int received = 0;
    int malformed = 0;
    std::vector<std::string> errors;
};

} // namespace

BatchAggregator::BatchAggregator(size_t batch_size, std::chrono::milliseconds collection_window)
    : batch_size_(batch_size > 0 ? batch_size : 1)
    , collection_window_(collection_window)
{}

void BatchAggregator::set_batch_size(size_t batch_size) {
    batch_size_ = batch_size > 0 ? batch_size : 1;
}

bool BatchAggregator::ready(size_t pending, std::chrono::milliseconds oldest_age) const {
    return pending >= batch_size_ || oldest_age >= collection_window_;
}

std::string BatchAggregator::correlation_id(const std::string& symbol, const std::string& tag) {
    return fmt::format("{}:{}", symbol, tag);
}

nlohmann::json BatchAggregator::build_request(const std::vector<BatchMember>& members,
                                              const std::string& interval,
                                              const std::string& exchange,
                                              const std::vector<IndicatorSpec>& specs) const {
    nlohmann::json constructs = nlohmann::json::array();

    for (const auto& member : members) {
        nlohmann::json indicators = nlohmann::json::array();

        for (const auto& spec : specs) {
            nlohmann::json entry = spec.params;
            entry["indicator"] = spec.indicator;
            entry["id"] = correlation_id(member.symbol, spec.tag);
            indicators.push_back(entry);
        }

        constructs.push_back({
            {"exchange", exchange},
            {"symbol", member.provider_symbol},
            {"interval", interval},
            {"indicators", indicators}
        });
    }

    spdlog::info("Built bulk request: {} symbols, {} indicators",
                 members.size(), members.size() * specs.size());
    return constructs;
}

bool BatchAggregator::well_formed(const nlohmann::json& response) {
    return response.is_object() && response.contains("data") && response["data"].is_array();
}

std::vector<BatchOutcome> BatchAggregator::demultiplex(const nlohmann::json& response,
                                                       const std::vector<BatchMember>& members,
                                                       const std::vector<IndicatorSpec>& specs,
                                                       SnapshotSource source) const {
    std::map<std::string, SymbolAccumulator> by_symbol;
    for (const auto& member : members) {
        by_symbol[member.symbol];
    }

    std::map<std::string, const IndicatorSpec*> by_tag;
    for (const auto& spec : specs) {
        by_tag[spec.tag] = &spec;
    }

    if (well_formed(response)) {
        for (const auto& item : response["data"]) {
            if (!item.is_object() || !item.contains("id") || !item["id"].is_string()) {
                continue;
            }

            // Correlation id is SYMBOL:tag; split at the last separator
            std::string id = item["id"].get<std::string>();
            auto sep = id.rfind(':');
            if (sep == std::string::npos) continue;

            auto acc = by_symbol.find(id.substr(0, sep));
            auto spec = by_tag.find(id.substr(sep + 1));
            if (acc == by_symbol.end() || spec == by_tag.end()) {
                spdlog::debug("Ignoring bulk result with unknown id {}", id);
                continue;
            }

            if (item.contains("errors") && item["errors"].is_array() && !item["errors"].empty()) {
                const auto& first = item["errors"][0];
                acc->second.errors.push_back(first.is_string() ? first.get<std::string>() : first.dump());
                continue;
            }

            std::optional<nlohmann::json> value;
            if (item.contains("result")) {
                value = indicator_set::parse_result(*spec->second, item["result"]);
            }

            if (value) {
                acc->second.values[spec->second->tag] = *value;
                acc->second.received++;
            } else {
                acc->second.malformed++;
            }
        }
    }

    std::vector<BatchOutcome> outcomes;
    outcomes.reserve(members.size());

    for (const auto& member : members) {
        const auto& acc = by_symbol[member.symbol];

        BatchOutcome outcome;
        outcome.symbol = member.symbol;

        if (acc.received > 0) {
            outcome.ok = true;
            outcome.snapshot.symbol = member.symbol;
            outcome.snapshot.values = acc.values;
            outcome.snapshot.source = source;
            outcome.snapshot.is_fallback_data = false;
            outcome.snapshot.real_indicator_count = acc.received;
            outcome.snapshot.timestamp_ms = util::current_timestamp_ms();
            spdlog::debug("{}: {} indicators received", member.symbol, acc.received);
        } else if (!acc.errors.empty() && acc.malformed == 0) {
            outcome.error = classify_item_errors(acc.errors.front());
            outcome.reason = error_class_to_string(*outcome.error);
            spdlog::warn("Bulk entries for {} rejected: {}", member.symbol, acc.errors.front());
        } else if (acc.malformed > 0) {
            outcome.reason = "malformed_batch_entry";
            spdlog::warn("Malformed bulk entries for {}, using fallback", member.symbol);
        } else {
            outcome.reason = "missing_from_batch";
            spdlog::warn("No indicators received for {}, using fallback", member.symbol);
        }

        outcomes.push_back(outcome);
    }

    return outcomes;
}
