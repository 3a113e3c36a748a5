// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "commands.hpp"

#include <header_utils.hpp>
#include <http_transport.hpp>
#include <tus_log_init.hpp>
#include <upload_stream_impl.hpp>

#include <iomanip>
#include <iostream>
#include <optional>
#include <sstream>
#include <thread>
#include <vector>

#define TUS_LOG_COMPONENT "tus_cli"
#include <tus_log_macros.hpp>

namespace tus {
namespace cli {

namespace {

std::shared_ptr<client::ITransport> make_http_transport(const CliConfig& config) {
  return std::make_shared<client::HttpTransport>(to_transport_config(config));
}

}  // namespace

Commands::Commands()
    : Commands(make_http_transport, std::make_shared<client::UploadStreamFactoryImpl>()) {}

Commands::Commands(
  TransportFactory transport_factory, std::shared_ptr<client::IUploadStreamFactory> streams
)
    : transport_factory_(std::move(transport_factory))
    , streams_(std::move(streams))
    , verbose_(false) {}

client::TusClient& Commands::client() {
  if (!client_) {
    client_ = std::make_unique<client::TusClient>(
      transport_factory_(config_), to_client_config(config_)
    );
  }
  return *client_;
}

void Commands::setup_logging() {
  ::tus::logging::LoggingConfig log_config;
  convert_logging_config(config_.logging, log_config);
  if (verbose_) {
    log_config.console.min_level = ::tus::logging::severity_level::debug;
  }
  if (::tus::logging::is_logging_initialized()) {
    ::tus::logging::reconfigure_logging(log_config);
  } else {
    ::tus::logging::apply_env_overrides(log_config);
    ::tus::logging::init_logging(log_config);
  }
}

void Commands::print_error(const client::Error& error) {
  std::cerr << "Error: " << error.toString() << std::endl;
}

int Commands::info(const std::string& resource) {
  auto result = client().getInfo(resource);
  if (!result.ok()) {
    print_error(result.error());
    return 1;
  }

  const client::UploadInfo& info = result.value();
  std::cout << "Resource: " << resource << std::endl;
  std::cout << "Offset:   " << info.bytes_uploaded << " (" << format_size(info.bytes_uploaded)
            << ")" << std::endl;
  if (info.total_size) {
    std::cout << "Length:   " << *info.total_size << " (" << format_size(*info.total_size) << ")"
              << std::endl;
  } else {
    std::cout << "Length:   unknown" << std::endl;
  }
  if (info.metadata) {
    for (const auto& [key, value] : *info.metadata) {
      std::cout << "Metadata: " << key << "=" << value << std::endl;
    }
  }
  return 0;
}

int Commands::options() {
  auto result = client().getServerInfo(config_.server.endpoint);
  if (!result.ok()) {
    print_error(result.error());
    return 1;
  }

  const client::ServerInfo& info = result.value();
  std::cout << "Versions:   ";
  for (size_t i = 0; i < info.supported_versions.size(); ++i) {
    std::cout << (i > 0 ? ", " : "") << info.supported_versions[i];
  }
  std::cout << std::endl;

  std::cout << "Extensions: ";
  for (size_t i = 0; i < info.extensions.size(); ++i) {
    std::cout << (i > 0 ? ", " : "") << client::extensionToString(info.extensions[i]);
  }
  std::cout << std::endl;

  if (info.max_upload_size) {
    std::cout << "Max size:   " << format_size(*info.max_upload_size) << std::endl;
  }
  return 0;
}

int Commands::create(uint64_t size, const client::Metadata& metadata) {
  auto result = client().createWithMetadata(config_.server.endpoint, size, metadata);
  if (!result.ok()) {
    print_error(result.error());
    return 1;
  }
  std::cout << result.value() << std::endl;
  return 0;
}

int Commands::upload(const std::string& resource, const std::string& file, uint64_t chunk_size) {
  ResumePolicy policy(to_resume_config(config_.upload));
  uint64_t reached = 0;

  client::UploadCallbacks callbacks;
  callbacks.on_progress = [this, &reached, last_decile = -1](
                            uint64_t uploaded, uint64_t total
                          ) mutable {
    reached = uploaded;
    int decile = total == 0 ? 10 : static_cast<int>(uploaded * 10 / total);
    if (verbose_ && decile != last_decile) {
      last_decile = decile;
      std::cout << "Uploaded " << uploaded << " / " << total << " bytes" << std::endl;
    }
  };

  for (;;) {
    // The stream is consumed by each attempt; the client re-inspects and re-seeks
    auto stream = streams_->open(file);
    if (!stream) {
      std::cerr << "Error: cannot open " << file << std::endl;
      return 1;
    }

    client::Status status =
      client().uploadWithChunkSize(resource, std::move(stream), chunk_size, callbacks);
    if (status.ok()) {
      std::cout << "Upload complete: " << resource << std::endl;
      return 0;
    }

    auto delay = policy.onFailure(status.error(), reached);
    if (!delay) {
      print_error(status.error());
      return 1;
    }

    TUS_LOG_WARN(
      "Upload interrupted, resuming" << ::tus::logging::kv("resource", resource)
                                     << ::tus::logging::kv("offset", reached)
                                     << ::tus::logging::kv("attempt", policy.stalledAttempts())
                                     << ::tus::logging::kv("delay_ms", delay->count())
                                     << ::tus::logging::kv("error", status.error().toString())
    );
    std::this_thread::sleep_for(*delay);
  }
}

int Commands::send(
  const std::string& file, const client::Metadata& metadata, uint64_t chunk_size
) {
  auto probe = streams_->open(file);
  if (!probe) {
    std::cerr << "Error: cannot open " << file << std::endl;
    return 1;
  }
  auto size = probe->size();
  if (!size) {
    std::cerr << "Error: cannot determine size of " << file << std::endl;
    return 1;
  }
  probe.reset();

  auto location = client().createWithMetadata(config_.server.endpoint, *size, metadata);
  if (!location.ok()) {
    print_error(location.error());
    return 1;
  }
  std::cout << "Created " << location.value() << std::endl;

  return upload(location.value(), file, chunk_size);
}

int Commands::remove(const std::string& resource) {
  client::Status status = client().deleteUpload(resource);
  if (!status.ok()) {
    print_error(status.error());
    return 1;
  }
  std::cout << "Deleted " << resource << std::endl;
  return 0;
}

int Commands::execute(int argc, char* argv[]) {
  std::string command;

  if (argc > 1) {
    command = argv[1];
  }

  if (command.empty() || command == "help" || command == "-h" || command == "--help") {
    print_usage();
    return 0;
  }

  // Parse flags
  std::string config_path;
  std::string endpoint;
  std::optional<uint64_t> chunk_size;
  client::Metadata metadata;
  std::vector<std::string> args;

  for (int i = 2; i < argc; ++i) {
    std::string arg = argv[i];
    bool takes_value =
      arg == "--config" || arg == "-c" || arg == "--endpoint" || arg == "-e" ||
      arg == "--chunk-size" || arg == "--meta" || arg == "-m";
    if (takes_value && i + 1 >= argc) {
      std::cerr << "Error: " << arg << " requires a value" << std::endl;
      return 1;
    }

    if (arg == "--config" || arg == "-c") {
      config_path = argv[++i];
    } else if (arg == "--endpoint" || arg == "-e") {
      endpoint = argv[++i];
    } else if (arg == "--chunk-size") {
      chunk_size = client::parseUnsigned(argv[++i]);
      if (!chunk_size) {
        std::cerr << "Error: invalid chunk size '" << argv[i] << "'" << std::endl;
        return 1;
      }
    } else if (arg == "--meta" || arg == "-m") {
      std::string pair = argv[++i];
      size_t eq = pair.find('=');
      if (eq == std::string::npos || eq == 0) {
        std::cerr << "Error: metadata must be key=value, got '" << pair << "'" << std::endl;
        return 1;
      }
      metadata[pair.substr(0, eq)] = pair.substr(eq + 1);
    } else if (arg == "--verbose" || arg == "-v") {
      verbose_ = true;
    } else if (!arg.empty() && arg[0] == '-') {
      std::cerr << "Error: Unknown option '" << arg << "'" << std::endl;
      return 1;
    } else {
      args.push_back(arg);
    }
  }

  // Load configuration: file first, then command line overrides
  if (!config_path.empty()) {
    ConfigParser parser;
    if (!parser.load_from_file(config_path, config_)) {
      std::cerr << "Error: " << parser.get_last_error() << std::endl;
      return 1;
    }
  }
  if (!endpoint.empty()) {
    config_.server.endpoint = endpoint;
  }
  if (chunk_size) {
    config_.upload.chunk_size = *chunk_size;
  }

  std::string error_msg;
  if (!ConfigParser::validate(config_, error_msg)) {
    std::cerr << "Error: " << error_msg << std::endl;
    return 1;
  }
  setup_logging();
  client_.reset();

  auto require_args = [&](size_t count, const char* usage) {
    if (args.size() != count) {
      std::cerr << "Usage: tus_cli " << usage << std::endl;
      return false;
    }
    return true;
  };

  // Execute command
  if (command == "info") {
    return require_args(1, "info <resource>") ? info(args[0]) : 1;
  } else if (command == "options") {
    return require_args(0, "options") ? options() : 1;
  } else if (command == "create") {
    if (!require_args(1, "create <size> [--meta key=value ...]")) {
      return 1;
    }
    auto size = client::parseUnsigned(args[0]);
    if (!size) {
      std::cerr << "Error: invalid size '" << args[0] << "'" << std::endl;
      return 1;
    }
    return create(*size, metadata);
  } else if (command == "upload") {
    if (!require_args(2, "upload <resource> <file> [--chunk-size N]")) {
      return 1;
    }
    return upload(args[0], args[1], config_.upload.chunk_size);
  } else if (command == "send") {
    if (!require_args(1, "send <file> [--meta key=value ...] [--chunk-size N]")) {
      return 1;
    }
    return send(args[0], metadata, config_.upload.chunk_size);
  } else if (command == "delete") {
    return require_args(1, "delete <resource>") ? remove(args[0]) : 1;
  } else {
    std::cerr << "Error: Unknown command '" << command << "'" << std::endl;
    print_usage();
    return 1;
  }
}

void Commands::print_usage() {
  std::cout << "Usage: tus_cli <command> [options]\n"
            << "\n"
            << "Commands:\n"
            << "  info <resource>              Show offset, length and metadata of an upload\n"
            << "  options                      Show server versions and extensions\n"
            << "  create <size>                Create an upload resource\n"
            << "  upload <resource> <file>     Upload (or resume) a file to a resource\n"
            << "  send <file>                  Create a resource and upload the file\n"
            << "  delete <resource>            Delete an upload resource\n"
            << "  help                         Show this message\n"
            << "\n"
            << "Options:\n"
            << "  -c, --config <file>          YAML configuration file\n"
            << "  -e, --endpoint <url>         Creation endpoint (overrides config)\n"
            << "  --chunk-size <bytes>         Bytes per PATCH request\n"
            << "  -m, --meta <key=value>       Metadata for create/send (repeatable)\n"
            << "  -v, --verbose                Debug logging and progress output\n";
}

std::string Commands::format_size(uint64_t size) {
  const char* units[] = {"B", "KB", "MB", "GB", "TB"};
  int unit = 0;
  double value = static_cast<double>(size);
  while (value >= 1024.0 && unit < 4) {
    value /= 1024.0;
    ++unit;
  }

  std::ostringstream oss;
  if (unit == 0) {
    oss << size << " B";
  } else {
    oss << std::fixed << std::setprecision(1) << value << " " << units[unit];
  }
  return oss.str();
}

}  // namespace cli
}  // namespace tus
