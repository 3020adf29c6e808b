#pragma once

#include <cstdint>
#include <string>

namespace roster::db::model {

// id is the external chat account id.
struct UserRecord {
  int64_t     id = 0;
  std::string first_name;
  std::string last_name;
  std::string full_name;
  std::string handle;
};

} // namespace roster::db::model
