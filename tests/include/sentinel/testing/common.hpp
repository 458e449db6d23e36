#pragma once

#include <sentinel/policy/loader.hpp>
#include <sentinel/schema/policy.hpp>
#include <sentinel/schema/value.hpp>

#include <spdlog/logger.h>
#include <spdlog/sinks/ostream_sink.h>

#include <chrono>
#include <filesystem>
#include <initializer_list>
#include <memory>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace sentinel::testing {

/// The policy used throughout the suites: a file-name validator, an upload
/// root and a small request schema.
inline constexpr auto kUploadPolicy = std::string_view{R"(
version: 1
defaults:
  mode: block
validators:
  - id: safe_filename
    type: string
    max_len: 100
    allow_charset: "A-Za-z0-9._-"
    deny_substrings: ["..", "/"]
  - id: path_in_uploads
    type: path
    must_be_under: ["/srv/uploads"]
  - id: request_shape
    type: json_schema
    schema:
      type: object
      required: [name]
      properties:
        name: {type: string, maxLength: 16}
        size: {type: integer, minimum: 0}
sinks:
  - id: file_write
    function: file.write
    require: [safe_filename]
  - id: upload_write
    function: upload.write
    require: [path_in_uploads]
  - id: request_body
    function: api.submit
    require: [request_shape]
)"};

inline sentinel::schema::policy_ptr_t make_policy(
    const std::string_view yaml = kUploadPolicy) {
  return sentinel::policy::load_policy_string(yaml);
}

inline std::vector<sentinel::schema::value_t> make_strings(
    std::initializer_list<std::string_view> items) {
  auto out = std::vector<sentinel::schema::value_t>{};
  for (const auto item : items) {
    out.emplace_back(std::string{item});
  }
  return out;
}

inline std::string make_db_path(const std::string_view prefix) {
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

/// Logger whose output lands in `out`, one message per line.
inline std::shared_ptr<spdlog::logger> make_capture_logger(
    std::ostringstream& out) {
  auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(out);
  auto logger = std::make_shared<spdlog::logger>("audit_capture", sink);
  logger->set_pattern("%v");
  return logger;
}

inline std::vector<std::string> split_lines(const std::string& text) {
  auto lines = std::vector<std::string>{};
  auto in = std::istringstream{text};
  for (auto line = std::string{}; std::getline(in, line);) {
    if (!line.empty()) {
      lines.push_back(line);
    }
  }
  return lines;
}

}  // namespace sentinel::testing
