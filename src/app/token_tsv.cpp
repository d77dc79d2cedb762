#include <sanctum/app/token_tsv.hpp>
#include <sanctum/vision/ocr_backend.hpp>
#include <charconv>
#include <cmath>
#include <fstream>
#include <sstream>

namespace sanctum::app {

namespace {

constexpr std::size_t kTsvColumns = 12;
constexpr int kWordLevel = 5;

std::vector<std::string_view> split_tabs(std::string_view line) {
  std::vector<std::string_view> cols;
  std::size_t begin = 0;
  while (true) {
    const auto tab = line.find('\t', begin);
    if (tab == std::string_view::npos) {
      cols.push_back(line.substr(begin));
      break;
    }
    cols.push_back(line.substr(begin, tab - begin));
    begin = tab + 1;
  }
  return cols;
}

bool to_int(std::string_view s, int& out) {
  const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
  return ec == std::errc() && ptr == s.data() + s.size();
}

/// Tesseract writes confidences such as "96.532104" or "-1".
bool to_confidence(std::string_view s, int& out) {
  double value = 0.0;
  const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
  if (ec != std::errc() || ptr != s.data() + s.size()) return false;
  out = static_cast<int>(std::lround(value));
  return true;
}

}  // namespace

std::vector<sanctum::core::Token> parse_tokens_tsv(std::string_view tsv, int confidence_threshold) {
  std::vector<sanctum::core::Token> tokens;
  std::size_t begin = 0;
  while (begin < tsv.size()) {
    auto newline = tsv.find('\n', begin);
    if (newline == std::string_view::npos) newline = tsv.size();
    std::string_view line = tsv.substr(begin, newline - begin);
    begin = newline + 1;
    if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
    if (line.empty()) continue;

    const auto cols = split_tabs(line);
    if (cols.size() < kTsvColumns) continue;

    int level = 0;
    if (!to_int(cols[0], level) || level != kWordLevel) continue;  // also skips the header

    sanctum::core::Token t;
    int conf = 0;
    if (!to_int(cols[6], t.bbox.x) || !to_int(cols[7], t.bbox.y) ||
        !to_int(cols[8], t.bbox.w) || !to_int(cols[9], t.bbox.h) ||
        !to_confidence(cols[10], conf)) {
      continue;
    }
    const std::string_view text = cols[11];
    if (!sanctum::vision::accept_token(text, conf, confidence_threshold)) continue;

    t.text.assign(text);
    t.confidence = conf;
    tokens.push_back(std::move(t));
  }
  return tokens;
}

std::expected<std::vector<sanctum::core::Token>, sanctum::core::DetectionError>
load_tokens_tsv(const std::string& path, int confidence_threshold) {
  std::ifstream f(path, std::ios::binary);
  if (!f) {
    return std::unexpected(sanctum::core::DetectionError::LoadFailed);
  }
  std::ostringstream buffer;
  buffer << f.rdbuf();
  return parse_tokens_tsv(buffer.str(), confidence_threshold);
}

}  // namespace sanctum::app
