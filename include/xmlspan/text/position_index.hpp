// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of XmlSpan, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <algorithm>
#include <cstddef>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace xmlspan
{
namespace text
{
/// \brief Maps 1-based (line, column) scanner coordinates to byte offsets
/// into the source, and back.
///
/// Built once per source; read-only afterwards. The index does not own the
/// source text, which must outlive it.
class PositionIndex
{
public:
  PositionIndex() = default;

  /// \brief Scan the source once and record the offset of every '\n'.
  static PositionIndex build(std::string_view source)
  {
    PositionIndex index;
    index._size = source.size();
    for (std::size_t i = 0; i < source.size(); ++i)
    {
      if (source[i] == '\n')
      {
        index._breaks.push_back(i);
      }
    }
    return index;
  }

  /// \brief Offset of (line, column), or std::nullopt when the line does not
  /// exist or the offset falls outside the source.
  std::optional<std::size_t> resolve(std::size_t line, std::size_t column) const
  {
    if (line < 1 || column < 1 || line > _breaks.size() + 1)
    {
      return std::nullopt;
    }
    std::size_t offset = lineStart(line) + column - 1;
    if (offset >= _size)
    {
      return std::nullopt;
    }
    return offset;
  }

  /// \brief Inverse of resolve(): the (line, column) holding offset.
  std::optional<std::pair<std::size_t, std::size_t>> locate(std::size_t offset) const
  {
    if (offset >= _size)
    {
      return std::nullopt;
    }
    // Number of breaks strictly before offset is the 0-based line.
    auto it = std::lower_bound(_breaks.begin(), _breaks.end(), offset);
    std::size_t line = static_cast<std::size_t>(it - _breaks.begin()) + 1;
    return std::make_pair(line, offset - lineStart(line) + 1);
  }

  std::size_t lineCount() const { return _breaks.size() + 1; }

  std::size_t sourceSize() const { return _size; }

  const std::vector<std::size_t> &breakOffsets() const { return _breaks; }

private:
  std::size_t lineStart(std::size_t line) const
  {
    return line == 1 ? 0 : _breaks[line - 2] + 1;
  }

  std::vector<std::size_t> _breaks;
  std::size_t _size{0};
};

} // namespace text
} // namespace xmlspan
