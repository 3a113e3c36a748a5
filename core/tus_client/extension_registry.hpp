// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef TUS_EXTENSION_REGISTRY_HPP
#define TUS_EXTENSION_REGISTRY_HPP

#include <optional>
#include <string>
#include <vector>

#include "tus_types.hpp"

namespace tus {
namespace client {

/**
 * Maps Tus-Extension tokens onto the closed Extension set
 */
class ExtensionRegistry {
public:
  /**
   * Parse a comma-separated extension list.
   *
   * Tokens are whitespace-trimmed and kept in encounter order, duplicates
   * included. Unknown tokens are dropped.
   */
  static std::vector<Extension> parse(const std::string& header_value);

  /**
   * Look up a single (already trimmed, lowercase) token
   */
  static std::optional<Extension> fromToken(const std::string& token);
};

}  // namespace client
}  // namespace tus

#endif  // TUS_EXTENSION_REGISTRY_HPP
