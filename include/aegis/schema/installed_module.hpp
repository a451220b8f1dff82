#pragma once

#include <aegis/schema/module_type.hpp>
#include <aegis/schema/primitives.hpp>

namespace aegis::schema {

struct installed_module_t final {
  module_type_t type{module_type_t::validator};
  module_id_t module_id{};
  bool operator==(const installed_module_t&) const = default;
};

}  // namespace aegis::schema
