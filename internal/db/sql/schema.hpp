#pragma once

#include <string>
#include <vector>

namespace convintel::db::sql {

/*
  Table layout shared by the SQL backends.

  Enums are stored as their integer values, timestamps as unix millis,
  booleans as 0/1 integers and payloads as canonical JSON text.
*/

inline constexpr int kSchemaVersion = 1;

std::vector<std::string> SqliteSchema();
std::vector<std::string> PostgresSchema();

} // namespace convintel::db::sql
