// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of XmlSpan, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <cstddef>
#include <optional>
#include <string>

namespace xmlspan
{
/// \brief Options for a DocumentParser: tree-building policy plus scanner safety limits.
struct ParserOptions
{
  /// Characters stripped from both ends of each element's raw text when it
  /// closes. std::nullopt leaves raw text untouched.
  std::optional<std::string> trimming;
  bool ignoreNamespaces{false};           ///< Drop "prefix:" from element names
  std::string paragraphElement{"p"};      ///< Inserts '\n' before its text unless text is empty
  std::string lineBreakElement{"br"};     ///< Always inserts '\n'
  bool verifyProvenance{false};           ///< Re-check every mapping after the parse, log failures
  std::size_t maxDepth{256};              ///< Max element nesting depth
  std::size_t maxAttributesPerElement{256};
  std::size_t maxNameLength{1024};
  std::size_t maxTextSpan{1u << 20}; ///< Max contiguous text run in bytes (1 MiB)

  /// \brief The usual trimming set: space, tab, CR, LF, VT and FF.
  static std::string whitespaceAndNewlines() { return std::string(" \t\n\r\v\f"); }
};

} // namespace xmlspan
