// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef TUS_CLI_CONFIG_HPP
#define TUS_CLI_CONFIG_HPP

#include <yaml-cpp/yaml.h>

#include <cstdint>
#include <string>

#include <header_utils.hpp>
#include <http_transport.hpp>
#include <tus_client.hpp>
#include <tus_log_init.hpp>

#include "resume_policy.hpp"

namespace tus {
namespace cli {

/**
 * Server connection settings
 */
struct ServerConfig {
  std::string endpoint;  // Creation endpoint, e.g. https://tus.example.com/files/
  int timeout_s = 30;
  bool verify_tls = true;
  client::HeaderMap headers;  // Extra headers sent with every request
};

/**
 * Upload and resume settings
 */
struct UploadConfig {
  uint64_t chunk_size = client::DEFAULT_CHUNK_SIZE;
  int max_resume_attempts = 3;
  int initial_delay_ms = 1000;
  int max_delay_ms = 30000;
  double exponential_base = 2.0;
  bool jitter = true;
};

/**
 * Logging settings as written in the YAML file
 */
struct LoggingConfig {
  // Console sink
  bool console_enabled = true;
  bool console_colors = true;
  bool console_timestamps = true;
  std::string console_level = "info";  // debug, info, warn, error, fatal

  // File sink
  bool file_enabled = false;
  std::string file_level = "debug";
  std::string file_directory = "/var/log/tus";
  std::string file_pattern = "tus_%Y%m%d_%H%M%S.log";
  std::string file_format = "text";  // json or text
  size_t rotation_size_mb = 50;
  size_t max_files = 10;
  bool rotate_at_midnight = true;
};

struct CliConfig {
  ServerConfig server;
  UploadConfig upload;
  LoggingConfig logging;
};

/**
 * Convert the YAML logging section to tus::logging::LoggingConfig.
 */
void convert_logging_config(
  const LoggingConfig& yaml_config, ::tus::logging::LoggingConfig& log_config
);

client::HttpTransportConfig to_transport_config(const CliConfig& config);

client::ClientConfig to_client_config(const CliConfig& config);

ResumeConfig to_resume_config(const UploadConfig& upload);

class ConfigParser {
public:
  ConfigParser() = default;

  /**
   * Load configuration from YAML file
   */
  bool load_from_file(const std::string& path, CliConfig& config);

  /**
   * Load configuration from YAML string
   */
  bool load_from_string(const std::string& yaml_content, CliConfig& config);

  /**
   * Validate configuration
   */
  static bool validate(const CliConfig& config, std::string& error_msg);

  /**
   * Get last error message
   */
  std::string get_last_error() const {
    return last_error_;
  }

private:
  bool parse_server(const YAML::Node& node, ServerConfig& server);
  bool parse_upload(const YAML::Node& node, UploadConfig& upload);
  bool parse_logging(const YAML::Node& node, LoggingConfig& logging);

  mutable std::string last_error_;
};

}  // namespace cli
}  // namespace tus

#endif  // TUS_CLI_CONFIG_HPP
