#pragma once

#include "indicator_snapshot.hpp"
#include <string>

class FallbackProvider {
public:
    IndicatorSnapshot build(const std::string& symbol, const std::string& reason) const;

    static nlohmann::json neutral_values();
};
