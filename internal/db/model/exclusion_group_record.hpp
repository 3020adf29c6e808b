#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace roster::db::model {

/*
  Named set of roles a single user may not hold together at one event.
*/

struct ExclusionGroupRecord {
  std::string          name;
  std::vector<int64_t> role_ids;
};

} // namespace roster::db::model
