#pragma once
#include <nlohmann/json.hpp>
#include <rampart/schema/policy.hpp>

namespace rampart::schema::encoding::json {

void encode(const policy<1>& o, nlohmann::json& out);
void decode(const nlohmann::json& in, policy<1>& o);

}  // namespace rampart::schema::encoding::json
