/**
 * labelcheck-server — HTTP front end for label verification.
 * Routes: POST /api/verify (multipart: image file + brandName, productClass,
 *         alcoholContent, netContents), GET /api/health.
 * Run:    ./build/labelcheck-server [--config path] [--host h] [--port n]
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

#include <httplib.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <csignal>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>

namespace {

httplib::Server* g_server = nullptr;

void handle_signal(int /*sig*/) {
  if (g_server) g_server->stop();
}

void send_json(httplib::Response& res, int status, const nlohmann::json& body) {
  res.status = status;
  res.set_content(body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace),
                  "application/json");
}

/// Form field from a multipart part or, failing that, a urlencoded parameter.
std::optional<std::string> form_value(const httplib::Request& req, const std::string& key) {
  if (req.has_file(key)) return req.get_file_value(key).content;
  if (req.has_param(key)) return req.get_param_value(key);
  return std::nullopt;
}

std::optional<labelcheck::core::UploadedImage> uploaded_image(const httplib::Request& req) {
  if (!req.has_file("image")) return std::nullopt;
  const auto part = req.get_file_value("image");
  labelcheck::core::UploadedImage image;
  image.filename = part.filename;
  image.content_type = part.content_type;
  image.bytes.resize(part.content.size());
  for (std::size_t i = 0; i < part.content.size(); ++i) {
    image.bytes[i] = static_cast<std::byte>(part.content[i]);
  }
  return image;
}

labelcheck::core::ExpectedFields expected_fields(const httplib::Request& req) {
  using labelcheck::core::FieldId;
  std::unordered_map<std::string, std::string> form;
  for (const FieldId field : {FieldId::BrandName, FieldId::ProductClass,
                              FieldId::AlcoholContent, FieldId::NetContents}) {
    const std::string key(labelcheck::core::form_key(field));
    if (auto v = form_value(req, key)) form.emplace(key, std::move(*v));
  }
  return labelcheck::core::ExpectedFields::from_form(form);
}

std::unique_ptr<labelcheck::vision::IOcrBackend> make_backend(
    const labelcheck::app::ServiceConfig& cfg) {
  if (cfg.ocr_backend == labelcheck::app::OcrBackendType::Mock) {
    spdlog::warn("Using mock OCR backend; every upload reads as empty text");
    return std::make_unique<labelcheck::vision::MockOcrBackend>();
  }
#ifdef LABELCHECK_HAS_TESSERACT
  auto tess = std::make_unique<labelcheck::vision::TesseractOcrBackend>(
      cfg.tessdata_path, cfg.ocr_language, cfg.ocr_min_height);
  tess->warmup();
  return tess;
#else
  throw std::runtime_error("Tesseract backend not available (build with OpenCV and Tesseract)");
#endif
}

void setup_routes(httplib::Server& svr, labelcheck::app::VerificationService& service) {
  svr.set_default_headers({
      {"Access-Control-Allow-Origin", "*"},
      {"Access-Control-Allow-Methods", "GET, POST, OPTIONS"},
      {"Access-Control-Allow-Headers", "Content-Type"},
  });

  svr.Options(R"(/api/.*)", [](const httplib::Request&, httplib::Response& res) {
    res.status = 204;
  });

  svr.Get("/api/health", [](const httplib::Request&, httplib::Response& res) {
    send_json(res, 200, nlohmann::json{{"status", "healthy"}});
  });

  svr.Post("/api/verify", [&service](const httplib::Request& req, httplib::Response& res) {
    try {
      auto result = service.verify(uploaded_image(req), expected_fields(req));
      if (!result) {
        const auto err = labelcheck::app::to_error_response(result.error());
        send_json(res, err.status, err.body);
        return;
      }
      send_json(res, 200, labelcheck::app::to_json(*result));
    } catch (const std::exception& e) {
      spdlog::error("/api/verify: {}", e.what());
      send_json(res, 500, nlohmann::json{{"error", "An error occurred"}, {"details", e.what()}});
    }
  });
}

}  // namespace

int main(int argc, char* argv[]) {
  std::string config_path;
  std::string host_override;
  std::string port_override;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (arg == "--host" && i + 1 < argc) {
      host_override = argv[++i];
    } else if (arg == "--port" && i + 1 < argc) {
      port_override = argv[++i];
    } else if (arg == "--help" || arg == "-h") {
      std::cout << "Usage: labelcheck-server [--config <path>] [--host <addr>] [--port <n>]\n";
      return 0;
    }
  }

  labelcheck::app::ServiceConfig cfg = config_path.empty()
                                           ? labelcheck::app::default_config()
                                           : labelcheck::app::load_config(config_path);
  if (!host_override.empty()) cfg.server_host = host_override;
  if (!port_override.empty()) {
    unsigned long port = 0;
    try {
      port = std::stoul(port_override);
    } catch (const std::exception&) {
      port = 0;
    }
    if (port == 0 || port > 65535) {
      std::cerr << "Invalid --port " << port_override << "\n";
      return 1;
    }
    cfg.server_port = static_cast<std::uint16_t>(port);
  }

  labelcheck::app::init_logging(cfg.log_level);
  for (const auto& w : cfg.warnings) spdlog::warn("config: {}", w);

  std::unique_ptr<labelcheck::vision::IOcrBackend> backend;
  try {
    backend = make_backend(cfg);
  } catch (const std::exception& e) {
    spdlog::critical("OCR backend init failed: {}", e.what());
    return 1;
  }

  labelcheck::app::VerificationService service(*backend, cfg.verifier);

  httplib::Server svr;
  svr.set_payload_max_length(cfg.max_upload_bytes);
  setup_routes(svr, service);

  g_server = &svr;
  std::signal(SIGINT, handle_signal);
  std::signal(SIGTERM, handle_signal);

  spdlog::info("labelcheck-server listening on http://{}:{}", cfg.server_host, cfg.server_port);
  if (!svr.listen(cfg.server_host, cfg.server_port)) {
    spdlog::critical("Failed to bind {}:{}", cfg.server_host, cfg.server_port);
    return 1;
  }
  spdlog::info("labelcheck-server stopped");
  return 0;
}
