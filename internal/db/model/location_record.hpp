#pragma once

#include <cstdint>
#include <string>

namespace roster::db::model {

struct LocationRecord {
  int64_t     id = 0;
  std::string name;
  bool        active = true;
};

} // namespace roster::db::model
