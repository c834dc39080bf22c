/**
 * labelcheck-cli — Verify one label image (or its OCR text) against form values.
 * Build: cmake -B build && cmake --build build
 * Run:   ./build/labelcheck-cli --input label.png --brand "Old Barrel" --class Whiskey --abv 40
 * With --input: also writes results to <output>/<basename>.json (same content as terminal).
 * Exit:  0 all checks matched, 2 verification ran and something did not match, 1 error.
 */

#include <labelcheck/app/config.hpp>
#include <labelcheck/app/json_codec.hpp>
#include <labelcheck/app/logging.hpp>
#include <labelcheck/app/verification_service.hpp>
#include <labelcheck/core/fields.hpp>
#include <labelcheck/core/uploaded_image.hpp>
#include <labelcheck/vision/mock_ocr_backend.hpp>
#ifdef LABELCHECK_HAS_TESSERACT
#include <labelcheck/vision/tesseract_ocr_backend.hpp>
#endif

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <cstddef>
#include <exception>
#include <expected>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

namespace {

constexpr int kExitMatched = 0;
constexpr int kExitError = 1;
constexpr int kExitMismatch = 2;

std::optional<labelcheck::core::UploadedImage> read_upload(const std::string& path) {
  std::ifstream f(path, std::ios::binary);
  if (!f) return std::nullopt;
  const std::vector<char> raw((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());

  labelcheck::core::UploadedImage image;
  image.filename = std::filesystem::path(path).filename().string();
  image.bytes.reserve(raw.size());
  for (const char c : raw) image.bytes.push_back(static_cast<std::byte>(c));
  return image;
}

std::optional<std::string> read_text(const std::string& path) {
  std::ifstream f(path, std::ios::binary);
  if (!f) return std::nullopt;
  std::ostringstream ss;
  ss << f.rdbuf();
  return ss.str();
}

std::unique_ptr<labelcheck::vision::IOcrBackend> make_backend(
    const labelcheck::app::ServiceConfig& cfg) {
  if (cfg.ocr_backend == labelcheck::app::OcrBackendType::Mock) {
    return std::make_unique<labelcheck::vision::MockOcrBackend>();
  }
#ifdef LABELCHECK_HAS_TESSERACT
  return std::make_unique<labelcheck::vision::TesseractOcrBackend>(
      cfg.tessdata_path, cfg.ocr_language, cfg.ocr_min_height);
#else
  throw std::runtime_error(
      "Tesseract backend not available (build with OpenCV and Tesseract, or use --text)");
#endif
}

}  // namespace

int main(int argc, char* argv[]) {
  std::string config_path;
  std::string input_path;
  std::string text_path;
  std::string backend_override;
  std::string tessdata_override;
  std::string log_level_override;
  std::string output_dir = "output";
  labelcheck::core::ExpectedFields expected;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (arg == "--input" && i + 1 < argc) {
      input_path = argv[++i];
    } else if (arg == "--text" && i + 1 < argc) {
      text_path = argv[++i];
    } else if (arg == "--brand" && i + 1 < argc) {
      expected.brand_name = argv[++i];
    } else if (arg == "--class" && i + 1 < argc) {
      expected.product_class = argv[++i];
    } else if (arg == "--abv" && i + 1 < argc) {
      expected.alcohol_content = argv[++i];
    } else if (arg == "--net" && i + 1 < argc) {
      expected.net_contents = argv[++i];
    } else if (arg == "--backend" && i + 1 < argc) {
      backend_override = argv[++i];
    } else if (arg == "--tessdata" && i + 1 < argc) {
      tessdata_override = argv[++i];
    } else if (arg == "--log-level" && i + 1 < argc) {
      log_level_override = argv[++i];
    } else if (arg == "--output" && i + 1 < argc) {
      output_dir = argv[++i];
    } else if (arg == "--help" || arg == "-h") {
      std::cout << "Usage: labelcheck-cli [options] (--input <image> | --text <file>)\n"
                << "  --config <path>     Service config (key=value file); default: built-in\n"
                << "  --input <path>      Label image to OCR and verify\n"
                << "  --text <path>       Pre-extracted OCR text (skips OCR)\n"
                << "  --brand <s>         Expected brand name\n"
                << "  --class <s>         Expected product class/type\n"
                << "  --abv <s>           Expected alcohol content, e.g. 40 or 40%\n"
                << "  --net <s>           Expected net contents (optional), e.g. \"750 ml\"\n"
                << "  --backend <type>    Override OCR backend: tesseract | mock\n"
                << "  --tessdata <dir>    Override Tesseract data directory\n"
                << "  --log-level <l>     trace | debug | info | warn | error\n"
                << "  --output <dir>      Where --input results are written (default: output)\n";
      return kExitMatched;
    }
  }

  labelcheck::app::ServiceConfig cfg = config_path.empty()
                                           ? labelcheck::app::default_config()
                                           : labelcheck::app::load_config(config_path);
  if (!log_level_override.empty()) cfg.log_level = log_level_override;
  if (!tessdata_override.empty()) cfg.tessdata_path = tessdata_override;
  if (!backend_override.empty() &&
      !labelcheck::app::parse_backend_type(backend_override, cfg.ocr_backend)) {
    std::cerr << "Unknown --backend " << backend_override << " (use tesseract or mock)\n";
    return kExitError;
  }

  labelcheck::app::init_logging(cfg.log_level);
  for (const auto& w : cfg.warnings) spdlog::warn("config: {}", w);

  if (input_path.empty() && text_path.empty()) {
    std::cerr << "Either --input <image> or --text <file> is required (see --help)\n";
    return kExitError;
  }

  std::expected<labelcheck::core::VerificationResult, labelcheck::core::Failure> result;
  try {
    if (!text_path.empty()) {
      const auto text = read_text(text_path);
      if (!text) {
        std::cerr << "Failed to read text file: " << text_path << "\n";
        return kExitError;
      }
      labelcheck::vision::MockOcrBackend backend(*text);
      labelcheck::app::VerificationService service(backend, cfg.verifier);
      result = service.verify_text(*text, expected);
    } else {
      const auto image = read_upload(input_path);
      if (!image) {
        std::cerr << "Failed to read image: " << input_path << "\n";
        return kExitError;
      }
      auto backend = make_backend(cfg);
      labelcheck::app::VerificationService service(*backend, cfg.verifier);
      result = service.verify(image, expected);
    }
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return kExitError;
  }

  nlohmann::json body;
  int exit_code = kExitMatched;
  if (result) {
    body = labelcheck::app::to_json(*result);
    exit_code = result->overall_match ? kExitMatched : kExitMismatch;
  } else {
    body = labelcheck::app::to_error_response(result.error()).body;
    exit_code = kExitError;
  }

  const std::string text = body.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) + "\n";
  std::cout << text;

  if (!input_path.empty()) {
    std::filesystem::path p(input_path);
    std::filesystem::path out_dir(output_dir);
    std::error_code ec;
    std::filesystem::create_directories(out_dir, ec);
    if (ec) {
      std::cerr << "Warning: could not create " << out_dir << ": " << ec.message() << "\n";
    }
    std::filesystem::path out_file = out_dir / (p.stem().string() + ".json");
    std::ofstream f(out_file);
    if (f) {
      f << text;
    } else {
      std::cerr << "Warning: could not write " << out_file << "\n";
    }
  }
  return exit_code;
}
