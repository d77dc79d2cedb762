#pragma once

#include <sanctum/core/policy.hpp>
#include <sanctum/vision/ocr_backend.hpp>
#include <sanctum/vision/redaction.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sanctum::app {

/// Which detectors a scan runs. The scan runner simply skips disabled ones.
struct TemplateDetectors {
  bool email{true};
  bool phone{true};
  bool ipv4{true};
  bool hostname{true};
  bool url{true};
  bool face{false};  // reserved, no detector yet
  bool custom{true};
};

/// Literal values never reported (exact match).
struct TemplateIgnore {
  std::vector<std::string> emails;
  std::vector<std::string> domains;
};

/// Redaction template: detection, selection and output settings for one use case.
struct RedactionTemplate {
  std::string id{"tpl_custom"};
  std::string name{"Custom Template"};
  TemplateDetectors detectors{};
  TemplateIgnore ignore{};
  std::vector<sanctum::core::CustomRule> custom_rules;
  sanctum::vision::RedactionStyle style{sanctum::vision::RedactionStyle::Solid};
  int ocr_conf{sanctum::vision::kDefaultOcrConfidence};
  bool url_flag_query_params{true};
  std::string export_format;  // "png" forces PNG output; empty keeps the input format
};

/// The three built-in templates: tpl_01_default, tpl_02_social_share, tpl_03_bug_report.
std::vector<RedactionTemplate> builtin_templates();

/// tpl_01_default.
RedactionTemplate default_template();

/// Built-in template with the given id, or nullopt.
std::optional<RedactionTemplate> find_builtin_template(std::string_view id);

/// Load a template from a simple key=value file (one per line, '#' comments),
/// starting from default_template(). A missing file gives the defaults; unknown
/// keys and unparsable values are logged and ignored.
RedactionTemplate load_template(const std::string& path);

/// The part of the template the detection core consumes.
sanctum::core::TemplatePolicy to_policy(const RedactionTemplate& tpl);

}  // namespace sanctum::app
