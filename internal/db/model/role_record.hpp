#pragma once

#include <cstdint>
#include <string>

namespace roster::db::model {

/*
  Catalogue role.

  - code is the stable identity used in configuration.
  - display_name is what volunteers pick; it is unique too, but constraints
    are always keyed by id.
*/

struct RoleRecord {
  int64_t     id = 0;
  std::string code;
  std::string display_name;

  // at most one assignee per event
  bool is_unique = false;

  // roster display order, ties broken by id
  int32_t sort_order = 0;
};

} // namespace roster::db::model
