// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "header_utils.hpp"

#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/trim.hpp>

#include <charconv>

namespace tus {
namespace client {

std::optional<std::string> findHeader(const HeaderMap& headers, const std::string& name) {
  for (const auto& [key, value] : headers) {
    if (boost::algorithm::iequals(key, name)) {
      return value;
    }
  }
  return std::nullopt;
}

std::optional<uint64_t> parseUnsigned(const std::string& value) {
  std::string trimmed = boost::algorithm::trim_copy(value);
  if (trimmed.empty()) {
    return std::nullopt;
  }

  uint64_t result = 0;
  const char* first = trimmed.data();
  const char* last = trimmed.data() + trimmed.size();
  auto [ptr, ec] = std::from_chars(first, last, result);
  if (ec != std::errc() || ptr != last) {
    return std::nullopt;
  }
  return result;
}

std::vector<std::string> splitList(const std::string& value) {
  std::vector<std::string> parts;
  boost::algorithm::split(parts, value, boost::algorithm::is_any_of(","));

  std::vector<std::string> tokens;
  for (auto& part : parts) {
    boost::algorithm::trim(part);
    if (!part.empty()) {
      tokens.push_back(part);
    }
  }
  return tokens;
}

}  // namespace client
}  // namespace tus
