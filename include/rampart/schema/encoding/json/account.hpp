#pragma once
#include <nlohmann/json.hpp>
#include <rampart/schema/account.hpp>

namespace rampart::schema::encoding::json {

void encode(const account<1>& o, nlohmann::json& out);
void decode(const nlohmann::json& in, account<1>& o);

}  // namespace rampart::schema::encoding::json
