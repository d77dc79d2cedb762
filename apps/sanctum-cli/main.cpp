/**
 * sanctum-cli: locate PII in a screenshot's OCR words and write a redacted copy.
 * Build: cmake -B build && cmake --build build
 * Run:   ./build/sanctum_cli --input shot.png --tokens shot.tsv --output redacted.png
 * Tokens come from --tokens (tesseract ... tsv output) or, when built with
 * Tesseract, from the OCR engine directly.
 */

#include <sanctum/app/config.hpp>
#include <sanctum/app/scan_runner.hpp>
#include <sanctum/app/token_tsv.hpp>
#include <sanctum/core/error.hpp>
#include <sanctum/core/image.hpp>
#include <sanctum/core/pii.hpp>
#include <sanctum/vision/load_image.hpp>
#include <sanctum/vision/mock_ocr_backend.hpp>
#include <sanctum/vision/redaction.hpp>
#ifdef SANCTUM_HAS_TESSERACT
#include <sanctum/vision/tesseract_ocr_backend.hpp>
#endif

#include <spdlog/spdlog.h>

#include <exception>
#include <filesystem>
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

void print_usage() {
  std::cout << "Usage: sanctum_cli --input <image> [options]\n"
            << "  --input <path>           Screenshot to scan\n"
            << "  --output <path>          Write the redacted image here\n"
            << "  --tokens <path>          OCR words as Tesseract TSV (skips the OCR engine)\n"
            << "  --template <path>        Template file (key=value)\n"
            << "  --template-id <id>       Built-in template (default tpl_01_default)\n"
            << "  --style <name>           Override style: solid | blur | pixelate\n"
            << "  --trusted-domain <d>     Never report d (repeatable; values with '@' are emails)\n"
            << "  --list-templates         Print built-in templates and exit\n"
            << "  --verbose                Debug logging\n";
}

void print_templates() {
  for (const auto& tpl : sanctum::app::builtin_templates()) {
    std::cout << tpl.id << "  " << tpl.name << "  style=" << sanctum::vision::to_string(tpl.style)
              << " ocr_conf=" << tpl.ocr_conf
              << " url_flag_query_params=" << (tpl.url_flag_query_params ? "true" : "false") << "\n";
  }
}

std::unique_ptr<sanctum::vision::IOcrBackend> make_ocr_backend(const std::string& tokens_path,
                                                               int ocr_conf) {
  if (!tokens_path.empty()) {
    // The TSV already holds the engine's words; the mock replays them through the same filter.
    auto tokens = sanctum::app::load_tokens_tsv(tokens_path, ocr_conf);
    if (!tokens) {
      throw std::runtime_error("cannot read tokens from " + tokens_path);
    }
    auto mock = std::make_unique<sanctum::vision::MockOcrBackend>();
    mock->set_tokens(std::move(*tokens));
    return mock;
  }
#ifdef SANCTUM_HAS_TESSERACT
  auto tess = std::make_unique<sanctum::vision::TesseractOcrBackend>();
  tess->warmup();
  return tess;
#else
  throw std::runtime_error(
      "no OCR engine: pass --tokens <tsv> or build with -DSANCTUM_USE_TESSERACT=ON");
#endif
}

std::string output_path_for(const std::string& requested, const std::string& export_format) {
  if (export_format != "png") return requested;
  std::filesystem::path p(requested);
  p.replace_extension(".png");
  return p.string();
}

}  // namespace

int main(int argc, char* argv[]) {
  std::string input_path;
  std::string output_path;
  std::string tokens_path;
  std::string template_path;
  std::string template_id;
  std::string style_override;
  std::vector<std::string> trusted;
  bool verbose = false;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--input" && i + 1 < argc) {
      input_path = argv[++i];
    } else if (arg == "--output" && i + 1 < argc) {
      output_path = argv[++i];
    } else if (arg == "--tokens" && i + 1 < argc) {
      tokens_path = argv[++i];
    } else if (arg == "--template" && i + 1 < argc) {
      template_path = argv[++i];
    } else if (arg == "--template-id" && i + 1 < argc) {
      template_id = argv[++i];
    } else if (arg == "--style" && i + 1 < argc) {
      style_override = argv[++i];
    } else if (arg == "--trusted-domain" && i + 1 < argc) {
      trusted.emplace_back(argv[++i]);
    } else if (arg == "--list-templates") {
      print_templates();
      return 0;
    } else if (arg == "--verbose" || arg == "-v") {
      verbose = true;
    } else if (arg == "--help" || arg == "-h") {
      print_usage();
      return 0;
    } else {
      std::cerr << "Unknown argument: " << arg << "\n";
      print_usage();
      return 1;
    }
  }

  spdlog::set_level(verbose ? spdlog::level::debug : spdlog::level::warn);

  if (input_path.empty()) {
    std::cerr << "--input is required\n";
    print_usage();
    return 1;
  }

  sanctum::app::RedactionTemplate tpl;
  if (!template_path.empty()) {
    tpl = sanctum::app::load_template(template_path);
  } else if (!template_id.empty()) {
    auto builtin = sanctum::app::find_builtin_template(template_id);
    if (!builtin) {
      std::cerr << "Unknown template id " << template_id << " (see --list-templates)\n";
      return 1;
    }
    tpl = std::move(*builtin);
  } else {
    tpl = sanctum::app::default_template();
  }

  if (!style_override.empty()) {
    auto style = sanctum::vision::parse_style(style_override);
    if (!style) {
      std::cerr << "Unknown --style " << style_override << " (use solid, blur, or pixelate)\n";
      return 1;
    }
    tpl.style = *style;
  }
  for (auto& value : trusted) {
    if (value.find('@') != std::string::npos) {
      tpl.ignore.emails.push_back(std::move(value));
    } else {
      tpl.ignore.domains.push_back(std::move(value));
    }
  }

  auto image = sanctum::vision::load_image(input_path);
  if (!image) {
    std::cerr << "Failed to load image: " << input_path << "\n";
    return 1;
  }

  std::unique_ptr<sanctum::vision::IOcrBackend> ocr;
  try {
    ocr = make_ocr_backend(tokens_path, tpl.ocr_conf);
  } catch (const std::exception& e) {
    std::cerr << "OCR setup failed: " << e.what() << "\n";
    return 1;
  }

  auto outcome = sanctum::app::run_redaction(*ocr, *image, tpl);
  if (!outcome) {
    std::cerr << "Redaction error: " << sanctum::core::to_string(outcome.error()) << "\n";
    return 1;
  }

  std::ostringstream out;
  out << "template=" << tpl.id << " items=" << outcome->scan.items.size()
      << " regions=" << outcome->scan.regions.size() << "\n";
  for (const auto& r : outcome->scan.regions) {
    const std::string_view type = r.pii_type ? sanctum::core::to_string(*r.pii_type) : "manual";
    out << "  " << type << " \"" << r.label_text << "\" rect=(" << r.x << "," << r.y << "," << r.w
        << "," << r.h << ") selected=" << (r.selected ? "yes" : "no") << "\n";
  }
  std::cout << out.str();

  if (!output_path.empty()) {
    const std::string path = output_path_for(output_path, tpl.export_format);
    if (!sanctum::vision::save_image(path, outcome->image)) {
      std::cerr << "Failed to write " << path << "\n";
      return 1;
    }
    spdlog::info("wrote {}", path);
  }
  return 0;
}
