#pragma once

#include "indicator_set.hpp"
#include "indicator_snapshot.hpp"
#include "error_classifier.hpp"
#include <string>
#include <vector>
#include <optional>
#include <chrono>
#include <nlohmann/json.hpp>

struct BatchMember {
    std::string symbol;           // normalized
    std::string provider_symbol;
};

struct BatchOutcome {
    std::string symbol;
    bool ok = false;
    IndicatorSnapshot snapshot;
    std::optional<ErrorClass> error;   // set when every entry for the symbol carried an error
    std::string reason;
};

class BatchAggregator {
public:
    BatchAggregator(size_t batch_size, std::chrono::milliseconds collection_window);

    size_t batch_size() const { return batch_size_; }
    void set_batch_size(size_t batch_size);
    std::chrono::milliseconds collection_window() const { return collection_window_; }

    // Flush once the batch is full or the oldest request has waited out the window
    bool ready(size_t pending, std::chrono::milliseconds oldest_age) const;

    nlohmann::json build_request(const std::vector<BatchMember>& members,
                                 const std::string& interval,
                                 const std::string& exchange,
                                 const std::vector<IndicatorSpec>& specs) const;

    std::vector<BatchOutcome> demultiplex(const nlohmann::json& response,
                                          const std::vector<BatchMember>& members,
                                          const std::vector<IndicatorSpec>& specs,
                                          SnapshotSource source) const;

    static bool well_formed(const nlohmann::json& response);
    static std::string correlation_id(const std::string& symbol, const std::string& tag);

private:
    size_t batch_size_;
    std::chrono::milliseconds collection_window_;
};
