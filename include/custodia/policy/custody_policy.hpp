#pragma once

#include <string>
#include <vector>

namespace custodia::policy {

/// Custody lifecycle rules. Fixed for the lifetime of a validator.
struct custody_policy final {
  std::vector<std::string> required_order;
  std::vector<std::string> allowed_skips;
  double max_access_duration_hours{48.0};
  bool no_parallel_access{true};
};

/// COLLECTED, SEALED, ANALYZED, VERIFIED; no skips; 48h; exclusive access.
custody_policy default_custody_policy();

}  // namespace custodia::policy
