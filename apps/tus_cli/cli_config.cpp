// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "cli_config.hpp"

#include <fstream>

namespace tus {
namespace cli {

// ============================================================================
// ConfigParser Implementation
// ============================================================================

bool ConfigParser::load_from_file(const std::string& path, CliConfig& config) {
  std::ifstream file(path);
  if (!file.good()) {
    last_error_ = "Config file not found or not readable: " + path;
    return false;
  }

  try {
    YAML::Node yaml = YAML::LoadFile(path);
    return load_from_string(YAML::Dump(yaml), config);
  } catch (const YAML::Exception& e) {
    last_error_ = "Failed to parse YAML file: " + std::string(e.what());
    return false;
  }
}

bool ConfigParser::load_from_string(const std::string& yaml_content, CliConfig& config) {
  try {
    YAML::Node node = YAML::Load(yaml_content);

    if (node["server"] && !parse_server(node["server"], config.server)) {
      return false;
    }
    if (node["upload"] && !parse_upload(node["upload"], config.upload)) {
      return false;
    }
    if (node["logging"] && !parse_logging(node["logging"], config.logging)) {
      return false;
    }

    return true;
  } catch (const YAML::Exception& e) {
    last_error_ = "Failed to parse YAML content: " + std::string(e.what());
    return false;
  }
}

bool ConfigParser::parse_server(const YAML::Node& node, ServerConfig& server) {
  if (node["endpoint"]) {
    server.endpoint = node["endpoint"].as<std::string>();
  }
  if (node["timeout_s"]) {
    server.timeout_s = node["timeout_s"].as<int>();
  }
  if (node["verify_tls"]) {
    server.verify_tls = node["verify_tls"].as<bool>();
  }
  if (node["headers"]) {
    const auto& headers = node["headers"];
    if (!headers.IsMap()) {
      last_error_ = "server.headers must be a map";
      return false;
    }
    for (const auto& header : headers) {
      server.headers[header.first.as<std::string>()] = header.second.as<std::string>();
    }
  }
  return true;
}

bool ConfigParser::parse_upload(const YAML::Node& node, UploadConfig& upload) {
  if (node["chunk_size"]) {
    upload.chunk_size = node["chunk_size"].as<uint64_t>();
  }
  if (node["max_resume_attempts"]) {
    upload.max_resume_attempts = node["max_resume_attempts"].as<int>();
  }
  if (node["initial_delay_ms"]) {
    upload.initial_delay_ms = node["initial_delay_ms"].as<int>();
  }
  if (node["max_delay_ms"]) {
    upload.max_delay_ms = node["max_delay_ms"].as<int>();
  }
  if (node["exponential_base"]) {
    upload.exponential_base = node["exponential_base"].as<double>();
  }
  if (node["jitter"]) {
    upload.jitter = node["jitter"].as<bool>();
  }
  return true;
}

bool ConfigParser::parse_logging(const YAML::Node& node, LoggingConfig& logging) {
  if (node["console"]) {
    const auto& console = node["console"];
    if (console["enabled"]) {
      logging.console_enabled = console["enabled"].as<bool>();
    }
    if (console["colors"]) {
      logging.console_colors = console["colors"].as<bool>();
    }
    if (console["timestamps"]) {
      logging.console_timestamps = console["timestamps"].as<bool>();
    }
    if (console["level"]) {
      logging.console_level = console["level"].as<std::string>();
    }
  }

  if (node["file"]) {
    const auto& file = node["file"];
    if (file["enabled"]) {
      logging.file_enabled = file["enabled"].as<bool>();
    }
    if (file["level"]) {
      logging.file_level = file["level"].as<std::string>();
    }
    if (file["directory"]) {
      logging.file_directory = file["directory"].as<std::string>();
    }
    if (file["pattern"]) {
      logging.file_pattern = file["pattern"].as<std::string>();
    }
    if (file["format"]) {
      logging.file_format = file["format"].as<std::string>();
    }
    if (file["rotation_size_mb"]) {
      logging.rotation_size_mb = file["rotation_size_mb"].as<size_t>();
    }
    if (file["max_files"]) {
      logging.max_files = file["max_files"].as<size_t>();
    }
    if (file["rotate_at_midnight"]) {
      logging.rotate_at_midnight = file["rotate_at_midnight"].as<bool>();
    }
  }

  return true;
}

bool ConfigParser::validate(const CliConfig& config, std::string& error_msg) {
  if (config.server.endpoint.empty()) {
    error_msg = "server.endpoint is required";
    return false;
  }
  if (!client::HttpTransport::parseUrl(config.server.endpoint)) {
    error_msg = "server.endpoint is not an http(s) URL: " + config.server.endpoint;
    return false;
  }
  if (config.server.timeout_s <= 0) {
    error_msg = "server.timeout_s must be positive";
    return false;
  }
  if (config.upload.chunk_size == 0) {
    error_msg = "upload.chunk_size must be greater than zero";
    return false;
  }
  if (config.upload.max_resume_attempts < 0) {
    error_msg = "upload.max_resume_attempts must not be negative";
    return false;
  }
  if (config.upload.initial_delay_ms <= 0 ||
      config.upload.max_delay_ms < config.upload.initial_delay_ms) {
    error_msg = "upload delays must satisfy 0 < initial_delay_ms <= max_delay_ms";
    return false;
  }
  if (!::tus::logging::parse_severity_level(config.logging.console_level) ||
      !::tus::logging::parse_severity_level(config.logging.file_level)) {
    error_msg = "logging levels must be one of debug, info, warn, error, fatal";
    return false;
  }
  if (config.logging.file_format != "json" && config.logging.file_format != "text") {
    error_msg = "logging.file.format must be json or text";
    return false;
  }
  return true;
}

// ============================================================================
// Conversions
// ============================================================================

void convert_logging_config(
  const LoggingConfig& yaml_config, ::tus::logging::LoggingConfig& log_config
) {
  log_config.console_enabled = yaml_config.console_enabled;
  log_config.console.colors = yaml_config.console_colors;
  log_config.console.timestamps = yaml_config.console_timestamps;
  if (auto level = ::tus::logging::parse_severity_level(yaml_config.console_level)) {
    log_config.console.min_level = *level;
  }

  log_config.file_enabled = yaml_config.file_enabled;
  if (auto level = ::tus::logging::parse_severity_level(yaml_config.file_level)) {
    log_config.file_level = *level;
  }

  log_config.file.directory = yaml_config.file_directory;
  log_config.file.file_pattern = yaml_config.file_pattern;
  log_config.file.format_json = (yaml_config.file_format == "json");
  log_config.file.rotation_size_mb = yaml_config.rotation_size_mb;
  log_config.file.max_files = static_cast<int>(yaml_config.max_files);
  log_config.file.rotate_at_midnight = yaml_config.rotate_at_midnight;
}

client::HttpTransportConfig to_transport_config(const CliConfig& config) {
  client::HttpTransportConfig transport;
  transport.base_url = config.server.endpoint;
  transport.request_timeout = std::chrono::seconds(config.server.timeout_s);
  transport.verify_tls = config.server.verify_tls;
  return transport;
}

client::ClientConfig to_client_config(const CliConfig& config) {
  client::ClientConfig client_config;
  client_config.chunk_size = config.upload.chunk_size;
  client_config.extra_headers = config.server.headers;
  return client_config;
}

ResumeConfig to_resume_config(const UploadConfig& upload) {
  ResumeConfig resume;
  resume.max_attempts = upload.max_resume_attempts;
  resume.initial_delay = std::chrono::milliseconds(upload.initial_delay_ms);
  resume.max_delay = std::chrono::milliseconds(upload.max_delay_ms);
  resume.exponential_base = upload.exponential_base;
  resume.jitter = upload.jitter;
  return resume;
}

}  // namespace cli
}  // namespace tus
