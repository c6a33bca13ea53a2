#pragma once

#include <optional>
#include <set>
#include <string>
#include <vector>

#include "models.hpp"

// Every source and (created) target library id referenced by a mirror.
std::set<std::string> managed_library_ids(const std::vector<Alternative>& alternatives);

// Library ids a user should see among the managed libraries, in the order
// the host lists them. Empty when the user has no record or is not
// managed, which means their access must be left alone.
//
// A user sees their own alternative's mirrors and never another
// alternative's. A source is hidden once the user's mirror of it exists on
// the host, and shown again as a fallback while that mirror is missing.
std::vector<std::string> project_library_access(const std::vector<Alternative>& alternatives,
                                                const std::optional<UserLanguageConfig>& user,
                                                const std::vector<std::string>& live_library_ids);
