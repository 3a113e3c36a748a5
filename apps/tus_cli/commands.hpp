// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef TUS_CLI_COMMANDS_HPP
#define TUS_CLI_COMMANDS_HPP

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

#include <stream_interfaces.hpp>
#include <transport_interfaces.hpp>
#include <tus_client.hpp>
#include <tus_types.hpp>

#include "cli_config.hpp"

namespace tus {
namespace cli {

/**
 * Builds the transport once the configuration is known
 */
using TransportFactory = std::function<std::shared_ptr<client::ITransport>(const CliConfig&)>;

/**
 * Command handler for tus_cli
 */
class Commands {
public:
  Commands();

  /**
   * Use the given transport and stream factories instead of HTTP and local files
   */
  Commands(
    TransportFactory transport_factory, std::shared_ptr<client::IUploadStreamFactory> streams
  );

  ~Commands() = default;

  // Non-copyable
  Commands(const Commands&) = delete;
  Commands& operator=(const Commands&) = delete;

  void set_verbose(bool verbose) {
    verbose_ = verbose;
  }

  /**
   * Execute info command
   */
  int info(const std::string& resource);

  /**
   * Execute options command
   */
  int options();

  /**
   * Execute create command
   */
  int create(uint64_t size, const client::Metadata& metadata);

  /**
   * Execute upload command, resuming on transient failures
   */
  int upload(const std::string& resource, const std::string& file, uint64_t chunk_size);

  /**
   * Execute send command: create a resource sized for the file, then upload it
   */
  int send(const std::string& file, const client::Metadata& metadata, uint64_t chunk_size);

  /**
   * Execute delete command
   */
  int remove(const std::string& resource);

  /**
   * Parse and execute command line
   */
  int execute(int argc, char* argv[]);

#ifdef TUS_CLI_TESTING
  CliConfig& config() {
    return config_;
  }
#endif

private:
  CliConfig config_;
  TransportFactory transport_factory_;
  std::shared_ptr<client::IUploadStreamFactory> streams_;
  std::unique_ptr<client::TusClient> client_;
  bool verbose_;

  /**
   * Build the client from the current configuration
   */
  client::TusClient& client();

  void setup_logging();

  void print_usage();

  void print_error(const client::Error& error);

  /**
   * Format size for human readable output
   */
  std::string format_size(uint64_t size);
};

}  // namespace cli
}  // namespace tus

#endif  // TUS_CLI_COMMANDS_HPP
