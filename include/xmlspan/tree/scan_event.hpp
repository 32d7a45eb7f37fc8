// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of XmlSpan, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <xmlspan/error.hpp>

#include <cstddef>
#include <map>
#include <string>
#include <variant>

namespace xmlspan
{
namespace tree
{
/// \brief Scanner events consumed by TreeBuilder, in document order.
///
/// Positions are 1-based. ElementStart/ElementEnd carry the position of the
/// tag's closing '>'; Characters carries the position of the '<' that ends
/// the text run.
struct ElementStart
{
  std::string name;
  std::map<std::string, std::string> attributes;
  std::size_t line{1};
  std::size_t column{1};
};

struct Characters
{
  std::string chunk;
  std::size_t line{1};
  std::size_t column{1};
};

struct CData
{
  std::string bytes;
};

struct ElementEnd
{
  std::string name;
  std::size_t line{1};
  std::size_t column{1};
};

struct ParseFailure
{
  ParseError cause;
};

using ScanEvent = std::variant<ElementStart, Characters, CData, ElementEnd, ParseFailure>;

} // namespace tree
} // namespace xmlspan
