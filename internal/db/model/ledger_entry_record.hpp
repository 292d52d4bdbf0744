#pragma once

#include <cstdint>
#include <string>

namespace roster::db::model {

// Append-only audit row. kind is "ADD", "DROP", "TRADE" or "DRAFT".
struct LedgerEntryRecord {
  uint64_t    entry_id = 0; // assigned by the store
  std::string league_id;
  std::string team_id;
  std::string user_id;
  std::string kind;
  std::string player_id;
  std::string source;
  uint64_t    created_at_ms = 0;
};

} // namespace roster::db::model
