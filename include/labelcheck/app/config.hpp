#pragma once

#include <labelcheck/core/label_verifier.hpp>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace labelcheck::app {

/// OCR backend type: tesseract (real engine) or mock (fixed text).
enum class OcrBackendType {
  Tesseract,
  Mock,
};

/// Service configuration: OCR engine, quality gate, HTTP endpoint, logging.
struct ServiceConfig {
  OcrBackendType ocr_backend{OcrBackendType::Tesseract};
  std::string tessdata_path;  // empty = Tesseract default
  std::string ocr_language{"eng"};
  std::uint32_t ocr_min_height{1000};

  core::VerifierOptions verifier{};

  std::string server_host{"0.0.0.0"};
  std::uint16_t server_port{5001};
  std::size_t max_upload_bytes{16u * 1024u * 1024u};

  std::string log_level{"info"};

  /// Lines the loader skipped (bad numbers, unknown backend). Not fatal.
  std::vector<std::string> warnings;
};

/// Load config from a simple key=value file (one per line, '#' comments).
/// Missing file -> defaults. Unknown keys are ignored; bad values keep the
/// default and add a warning.
ServiceConfig load_config(const std::string& path);

/// Default config when no file is provided.
ServiceConfig default_config();

/// Parse "tesseract" / "mock"; false for anything else.
bool parse_backend_type(const std::string& value, OcrBackendType& out);

}  // namespace labelcheck::app
