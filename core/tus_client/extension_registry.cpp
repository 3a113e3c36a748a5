// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "extension_registry.hpp"

#include <unordered_map>

#include "header_utils.hpp"

#define TUS_LOG_COMPONENT "extension_registry"
#include <tus_log_macros.hpp>

namespace tus {
namespace client {

std::optional<Extension> ExtensionRegistry::fromToken(const std::string& token) {
  static const std::unordered_map<std::string, Extension> known = {
    {"creation", Extension::CREATION},
    {"creation-with-upload", Extension::CREATION_WITH_UPLOAD},
    {"creation-defer-length", Extension::CREATION_DEFER_LENGTH},
    {"expiration", Extension::EXPIRATION},
    {"checksum", Extension::CHECKSUM},
    {"termination", Extension::TERMINATION},
    {"concatenation", Extension::CONCATENATION},
  };

  auto it = known.find(token);
  if (it == known.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<Extension> ExtensionRegistry::parse(const std::string& header_value) {
  std::vector<Extension> extensions;
  for (const auto& token : splitList(header_value)) {
    if (auto extension = fromToken(token)) {
      extensions.push_back(*extension);
    } else {
      TUS_LOG_DEBUG("Ignoring unknown extension" << logging::kv("token", token));
    }
  }
  return extensions;
}

}  // namespace client
}  // namespace tus
