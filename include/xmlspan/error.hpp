// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of XmlSpan, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <cstddef>
#include <string>

namespace xmlspan
{
/// \brief Error kinds surfaced by a parse. Only one exists: the scan was
/// interrupted and no tree is available.
enum class ErrorKind
{
  InterruptedParse
};

/// \brief A failed parse. Position fields are 0 when the scanner could not report them.
struct ParseError
{
  ErrorKind kind{ErrorKind::InterruptedParse};
  std::string message;
  std::size_t line{0};
  std::size_t column{0};
  std::size_t offset{0};

  std::string describe() const
  {
    std::string out = "interrupted parse";
    if (line != 0)
    {
      out += " at " + std::to_string(line) + ":" + std::to_string(column);
    }
    if (!message.empty())
    {
      out += ": " + message;
    }
    return out;
  }
};

} // namespace xmlspan
