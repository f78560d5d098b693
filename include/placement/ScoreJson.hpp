#pragma once

#include <string>
#include <vector>

#include "nlohmann/json.hpp"
#include "placement/Models.hpp"

namespace placement {

nlohmann::json breakdown_to_json(const std::vector<FactorContribution>& breakdown);
std::vector<FactorContribution> breakdown_from_json(const nlohmann::json& j, const std::string& where);

nlohmann::json pair_score_to_json(const PairScore& ps);
PairScore pair_score_from_json(const nlohmann::json& j, const std::string& where);

}  // namespace placement
