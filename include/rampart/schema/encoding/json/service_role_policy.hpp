#pragma once
#include <nlohmann/json.hpp>
#include <rampart/schema/service_role_policy.hpp>

namespace rampart::schema::encoding::json {

void encode(const service_role_policy<1>& o, nlohmann::json& out);
void decode(const nlohmann::json& in, service_role_policy<1>& o);

}  // namespace rampart::schema::encoding::json
