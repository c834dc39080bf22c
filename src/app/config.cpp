#include <labelcheck/app/config.hpp>
#include <charconv>
#include <fstream>
#include <limits>
#include <string_view>
#include <system_error>

namespace labelcheck::app {

namespace {

void trim(std::string& s) {
  const auto start = s.find_first_not_of(" \t\r\n");
  if (start == std::string::npos) {
    s.clear();
    return;
  }
  const auto end = s.find_last_not_of(" \t\r\n");
  s = s.substr(start, end - start + 1);
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

template <typename T>
bool parse_unsigned(const std::string& value, T& out) {
  unsigned long long v = 0;
  const auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), v);
  if (ec != std::errc{} || ptr != value.data() + value.size()) return false;
  if (v > std::numeric_limits<T>::max()) return false;
  out = static_cast<T>(v);
  return true;
}

}  // namespace

bool parse_backend_type(const std::string& value, OcrBackendType& out) {
  if (value == "tesseract") {
    out = OcrBackendType::Tesseract;
    return true;
  }
  if (value == "mock") {
    out = OcrBackendType::Mock;
    return true;
  }
  return false;
}

ServiceConfig default_config() {
  return ServiceConfig{};
}

ServiceConfig load_config(const std::string& path) {
  ServiceConfig c = default_config();
  std::ifstream f(path);
  if (!f) return c;

  std::string line;
  std::string key;
  std::string value;
  std::size_t line_no = 0;
  while (std::getline(f, line)) {
    ++line_no;
    trim(line);
    if (line.empty() || line[0] == '#') continue;
    if (!parse_line(line, key, value)) {
      c.warnings.push_back(path + ":" + std::to_string(line_no) + ": expected key=value");
      continue;
    }

    bool ok = true;
    if (key == "ocr_backend") ok = parse_backend_type(value, c.ocr_backend);
    else if (key == "tessdata_path") c.tessdata_path = value;
    else if (key == "ocr_language") c.ocr_language = value;
    else if (key == "ocr_min_height") ok = parse_unsigned(value, c.ocr_min_height);
    else if (key == "min_text_chars") ok = parse_unsigned(value, c.verifier.min_text_chars);
    else if (key == "preview_chars") ok = parse_unsigned(value, c.verifier.preview_chars);
    else if (key == "server_host") c.server_host = value;
    else if (key == "server_port") ok = parse_unsigned(value, c.server_port);
    else if (key == "max_upload_bytes") ok = parse_unsigned(value, c.max_upload_bytes);
    else if (key == "log_level") c.log_level = value;

    if (!ok) {
      c.warnings.push_back(path + ":" + std::to_string(line_no) + ": bad value for " + key +
                           ": '" + value + "'");
    }
  }
  return c;
}

}  // namespace labelcheck::app
