#include <rampart/schema/encoding/json/account.hpp>

#include <stdexcept>
#include <string>

namespace rampart::schema::encoding::json {

void encode(const account<1>& o, nlohmann::json& out) {
  out = nlohmann::json{{"name", o.name}, {"id", o.id}};
}

void decode(const nlohmann::json& in, account<1>& o) {
  o.name = in.at("name").get<std::string>();
  if (o.name.empty()) {
    throw std::invalid_argument{"account name must not be empty"};
  }
  if (auto it = in.find("id"); it != std::end(in)) {
    o.id = it->get<std::string>();
  }
}

}  // namespace rampart::schema::encoding::json
