#include <sanctum/app/config.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <charconv>
#include <fstream>
#include <string_view>

namespace sanctum::app {

namespace {

void trim(std::string& s) {
  const auto start = s.find_first_not_of(" \t\r\n");
  if (start == std::string::npos) {
    s.clear();
    return;
  }
  const auto end = s.find_last_not_of(" \t\r\n");
  s = s.substr(start, end == std::string::npos ? std::string::npos : end - start + 1);
}

bool parse_line(std::string_view line, std::string& key, std::string& value) {
  const auto pos = line.find('=');
  if (pos == std::string_view::npos) return false;
  key.assign(line.substr(0, pos));
  value.assign(line.substr(pos + 1));
  trim(key);
  trim(value);
  return !key.empty();
}

std::optional<bool> parse_bool(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (value == "true" || value == "1" || value == "yes" || value == "on") return true;
  if (value == "false" || value == "0" || value == "no" || value == "off") return false;
  return std::nullopt;
}

std::optional<int> parse_int(const std::string& value) {
  int out = 0;
  const auto* first = value.data();
  const auto* last = value.data() + value.size();
  const auto [ptr, ec] = std::from_chars(first, last, out);
  if (ec != std::errc() || ptr != last) return std::nullopt;
  return out;
}

/// Appends the comma-separated, trimmed, non-empty items of value to list.
void append_list(std::vector<std::string>& list, const std::string& value) {
  std::size_t begin = 0;
  while (begin <= value.size()) {
    const auto comma = value.find(',', begin);
    std::string item = value.substr(begin, comma == std::string::npos ? std::string::npos : comma - begin);
    trim(item);
    if (!item.empty()) list.push_back(std::move(item));
    if (comma == std::string::npos) break;
    begin = comma + 1;
  }
}

bool* detector_flag(TemplateDetectors& d, std::string_view name) {
  if (name == "email") return &d.email;
  if (name == "phone") return &d.phone;
  if (name == "ipv4") return &d.ipv4;
  if (name == "hostname") return &d.hostname;
  if (name == "url") return &d.url;
  if (name == "face") return &d.face;
  if (name == "custom") return &d.custom;
  return nullptr;
}

}  // namespace

std::vector<RedactionTemplate> builtin_templates() {
  using sanctum::vision::RedactionStyle;

  RedactionTemplate def;
  def.id = "tpl_01_default";
  def.name = "Default (Solid)";
  def.style = RedactionStyle::Solid;
  def.ocr_conf = sanctum::vision::kDefaultOcrConfidence;
  def.url_flag_query_params = true;

  RedactionTemplate social;
  social.id = "tpl_02_social_share";
  social.name = "Social Share Safe";
  social.style = RedactionStyle::Solid;
  social.ocr_conf = 70;
  social.url_flag_query_params = true;

  RedactionTemplate bug;
  bug.id = "tpl_03_bug_report";
  bug.name = "Bug Report Safe";
  bug.style = RedactionStyle::Blur;
  bug.ocr_conf = sanctum::vision::kDefaultOcrConfidence;
  bug.url_flag_query_params = false;  // URLs are usually wanted in bug reports

  return {def, social, bug};
}

RedactionTemplate default_template() {
  return builtin_templates().front();
}

std::optional<RedactionTemplate> find_builtin_template(std::string_view id) {
  for (auto& tpl : builtin_templates()) {
    if (tpl.id == id) return tpl;
  }
  return std::nullopt;
}

RedactionTemplate load_template(const std::string& path) {
  RedactionTemplate t = default_template();
  std::ifstream f(path);
  if (!f) return t;

  std::string line;
  std::string key;
  std::string value;
  int line_no = 0;
  while (std::getline(f, line)) {
    ++line_no;
    trim(line);
    if (line.empty() || line[0] == '#') continue;
    if (!parse_line(line, key, value)) continue;

    if (key == "id") t.id = value;
    else if (key == "name") t.name = value;
    else if (key == "style") {
      if (auto s = sanctum::vision::parse_style(value)) t.style = *s;
      else spdlog::warn("{}:{}: unknown style '{}'", path, line_no, value);
    }
    else if (key == "ocr_conf") {
      if (auto v = parse_int(value); v && *v >= 0 && *v <= 100) t.ocr_conf = *v;
      else spdlog::warn("{}:{}: ocr_conf must be 0-100, got '{}'", path, line_no, value);
    }
    else if (key == "url_flag_query_params") {
      if (auto b = parse_bool(value)) t.url_flag_query_params = *b;
      else spdlog::warn("{}:{}: expected boolean for {}, got '{}'", path, line_no, key, value);
    }
    else if (key.starts_with("detect.")) {
      bool* flag = detector_flag(t.detectors, std::string_view(key).substr(7));
      auto b = parse_bool(value);
      if (flag && b) *flag = *b;
      else spdlog::warn("{}:{}: bad detector setting {}={}", path, line_no, key, value);
    }
    else if (key == "ignore_email") append_list(t.ignore.emails, value);
    else if (key == "ignore_domain") append_list(t.ignore.domains, value);
    else if (key == "custom_rule") {
      const auto colon = value.find(':');
      if (colon == std::string::npos || colon == 0 || colon + 1 == value.size()) {
        spdlog::warn("{}:{}: custom_rule must be name:pattern", path, line_no);
        continue;
      }
      std::string rule_name = value.substr(0, colon);
      trim(rule_name);
      t.custom_rules.push_back({std::move(rule_name), value.substr(colon + 1)});
    }
    else if (key == "export_format") t.export_format = value;
    else spdlog::warn("{}:{}: unknown key '{}'", path, line_no, key);
  }
  return t;
}

sanctum::core::TemplatePolicy to_policy(const RedactionTemplate& tpl) {
  sanctum::core::TemplatePolicy p;
  p.ignore_emails = tpl.ignore.emails;
  p.ignore_domains = tpl.ignore.domains;
  p.custom_rules = tpl.custom_rules;
  p.flag_query_params_only = tpl.url_flag_query_params;
  return p;
}

}  // namespace sanctum::app
