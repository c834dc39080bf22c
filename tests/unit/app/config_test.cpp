#include <labelcheck/app/config.hpp>
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <string>

namespace la = labelcheck::app;

namespace {

std::filesystem::path write_temp_config(const std::string& name, const std::string& content) {
  const auto path = std::filesystem::temp_directory_path() / name;
  std::ofstream f(path);
  f << content;
  return path;
}

}  // namespace

TEST(Config, Defaults) {
  const auto c = la::default_config();
  EXPECT_EQ(c.ocr_backend, la::OcrBackendType::Tesseract);
  EXPECT_TRUE(c.tessdata_path.empty());
  EXPECT_EQ(c.ocr_language, "eng");
  EXPECT_EQ(c.verifier.min_text_chars, 10u);
  EXPECT_EQ(c.verifier.preview_chars, 200u);
  EXPECT_EQ(c.server_host, "0.0.0.0");
  EXPECT_EQ(c.server_port, 5001);
  EXPECT_EQ(c.log_level, "info");
  EXPECT_TRUE(c.warnings.empty());
}

TEST(Config, MissingFileGivesDefaults) {
  const auto c = la::load_config("/nonexistent/labelcheck_config_12345.conf");
  EXPECT_EQ(c.server_port, 5001);
  EXPECT_TRUE(c.warnings.empty());
}

TEST(Config, LoadsKeyValues) {
  const auto path = write_temp_config("labelcheck_config_test_ok.conf",
                                      "# service config\n"
                                      "\n"
                                      "ocr_backend = mock\n"
                                      "tessdata_path=/usr/share/tessdata\n"
                                      "ocr_language=eng+fra\n"
                                      "ocr_min_height=800\n"
                                      "min_text_chars=12\n"
                                      "preview_chars=80\n"
                                      "server_host=127.0.0.1\n"
                                      "server_port=8080\n"
                                      "max_upload_bytes=1048576\n"
                                      "log_level=debug\n"
                                      "something_else=ignored\n");
  const auto c = la::load_config(path.string());
  EXPECT_EQ(c.ocr_backend, la::OcrBackendType::Mock);
  EXPECT_EQ(c.tessdata_path, "/usr/share/tessdata");
  EXPECT_EQ(c.ocr_language, "eng+fra");
  EXPECT_EQ(c.ocr_min_height, 800u);
  EXPECT_EQ(c.verifier.min_text_chars, 12u);
  EXPECT_EQ(c.verifier.preview_chars, 80u);
  EXPECT_EQ(c.server_host, "127.0.0.1");
  EXPECT_EQ(c.server_port, 8080);
  EXPECT_EQ(c.max_upload_bytes, 1048576u);
  EXPECT_EQ(c.log_level, "debug");
  EXPECT_TRUE(c.warnings.empty());
  std::filesystem::remove(path);
}

TEST(Config, BadValuesKeepDefaultsAndWarn) {
  const auto path = write_temp_config("labelcheck_config_test_bad.conf",
                                      "server_port=99999\n"
                                      "min_text_chars=ten\n"
                                      "ocr_backend=onnx\n"
                                      "no equals sign here\n");
  const auto c = la::load_config(path.string());
  EXPECT_EQ(c.server_port, 5001);
  EXPECT_EQ(c.verifier.min_text_chars, 10u);
  EXPECT_EQ(c.ocr_backend, la::OcrBackendType::Tesseract);
  EXPECT_EQ(c.warnings.size(), 4u);
  std::filesystem::remove(path);
}

TEST(Config, ParseBackendType) {
  la::OcrBackendType t = la::OcrBackendType::Tesseract;
  EXPECT_TRUE(la::parse_backend_type("mock", t));
  EXPECT_EQ(t, la::OcrBackendType::Mock);
  EXPECT_TRUE(la::parse_backend_type("tesseract", t));
  EXPECT_EQ(t, la::OcrBackendType::Tesseract);
  EXPECT_FALSE(la::parse_backend_type("paddle", t));
  EXPECT_EQ(t, la::OcrBackendType::Tesseract);
}
