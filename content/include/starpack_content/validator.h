#pragma once

#include "starpack_content/diagnostics.h"
#include "starpack_content/merge.h"

#include <string>
#include <string_view>
#include <vector>

namespace starpack::content {

struct ValidateOptions {
  // Locales every display text should carry. English is mandatory at decode time;
  // the others only raise localization warnings.
  std::vector<std::string> locales{"en", "ru"};
};

// Fatal: duplicate ids, numeric range rules, unresolved references, research graph cycles.
// Warning: missing non-English locales, ids outside the lowercase_underscore convention.
Diagnostics validate(const MergedSet& merged, const ValidateOptions& options);

bool is_snake_case_id(std::string_view id);

} // namespace starpack::content
