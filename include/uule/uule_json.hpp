#pragma once
#include "uule/uulev1.hpp"
#include "uule/uulev2.hpp"
#include <nlohmann/json.hpp>

namespace uule {

// nlohmann::json conversions, found through ADL:
//   nlohmann::json j = data;  auto d = j.get<Uulev2Data>();

void to_json(nlohmann::json& j, const Uulev1Data& data);
void from_json(const nlohmann::json& j, Uulev1Data& data);

void to_json(nlohmann::json& j, const Uulev2Data& data);
void from_json(const nlohmann::json& j, Uulev2Data& data);

} // namespace uule
