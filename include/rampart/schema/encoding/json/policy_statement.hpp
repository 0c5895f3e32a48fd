#pragma once
#include <nlohmann/json.hpp>
#include <rampart/schema/policy_statement.hpp>

namespace rampart::schema::encoding::json {

void encode(const policy_statement<1>& o, nlohmann::json& out);
void decode(const nlohmann::json& in, policy_statement<1>& o);

}  // namespace rampart::schema::encoding::json
