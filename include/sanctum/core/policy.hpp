#pragma once

#include <sanctum/core/pii.hpp>
#include <sanctum/core/region.hpp>
#include <span>
#include <string>
#include <vector>

namespace sanctum::core {

/// Caller-defined pattern: matches are reported under name.
struct CustomRule {
  std::string name;
  std::string pattern;  // ECMAScript regex
};

/// Per-template detection and selection inputs consumed by the core.
struct TemplatePolicy {
  std::vector<std::string> ignore_emails;
  std::vector<std::string> ignore_domains;
  std::vector<CustomRule> custom_rules;
  /// When true only URLs carrying a query string are selected.
  bool flag_query_params_only{true};
};

/// Sets the initial selection of URL regions; other regions keep theirs.
/// regions must come from build_regions(items). Never adds or removes regions.
void apply_policy(std::span<const DetectedItem> items,
                  std::span<Region> regions,
                  const TemplatePolicy& policy);

}  // namespace sanctum::core
