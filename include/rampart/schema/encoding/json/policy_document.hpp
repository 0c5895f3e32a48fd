#pragma once
#include <nlohmann/json.hpp>
#include <rampart/schema/policy_document.hpp>

namespace rampart::schema::encoding::json {

void encode(const policy_document<1>& o, nlohmann::json& out);
void decode(const nlohmann::json& in, policy_document<1>& o);

}  // namespace rampart::schema::encoding::json
