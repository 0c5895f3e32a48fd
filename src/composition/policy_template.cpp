#include <rampart/composition/policy_template.hpp>

#include <mutex>
#include <utility>

namespace rampart::composition {

policy_template::policy_template(
    std::string key,
    schema::string_list_t variables,
    schema::scope_t scope,
    std::optional<schema::service_role_t> service_role)
    : key_{std::move(key)},
      variables_{std::move(variables)},
      scope_{std::move(scope)},
      service_role_{std::move(service_role)} {}

std::optional<template_binding> policy_template::binding() const {
  auto lock = std::scoped_lock{binding_mutex_};
  return binding_;
}

bool policy_template::try_bind(template_binding binding) {
  auto lock = std::scoped_lock{binding_mutex_};
  if (binding_.has_value()) {
    return false;
  }
  binding_ = std::move(binding);
  return true;
}

}  // namespace rampart::composition
