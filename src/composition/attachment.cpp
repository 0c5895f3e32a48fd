#include <rampart/composition/attachment.hpp>

#include <utility>

namespace rampart::composition {

attachment::attachment(std::shared_ptr<const policy_template> source_template,
                       std::shared_ptr<const schema::account_t> account,
                       schema::variables_t variables)
    : source_template_{std::move(source_template)},
      account_{std::move(account)},
      variables_{std::move(variables)} {}

std::string attachment::to_string() const {
  return source_template_->key() + "@" + account_->name;
}

}  // namespace rampart::composition
