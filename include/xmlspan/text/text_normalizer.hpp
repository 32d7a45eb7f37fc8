// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of XmlSpan, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <xmlspan/text/position_index.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace xmlspan
{
namespace text
{
/// \brief Half-open byte interval [begin, end).
struct ByteRange
{
  std::size_t begin{0};
  std::size_t end{0};

  std::size_t size() const { return end - begin; }
  bool empty() const { return begin == end; }

  bool operator==(const ByteRange &other) const
  {
    return begin == other.begin && end == other.end;
  }
  bool operator!=(const ByteRange &other) const { return !(*this == other); }
};

/// \brief One provenance entry: normalized[normalizedRange] == source[originalRange].
struct RangeMapping
{
  ByteRange originalRange;
  ByteRange normalizedRange;

  bool operator==(const RangeMapping &other) const
  {
    return originalRange == other.originalRange && normalizedRange == other.normalizedRange;
  }
  bool operator!=(const RangeMapping &other) const { return !(*this == other); }
};

/// \brief Structural whitespace skipped at the edges of a text span.
inline bool isBoundarySpace(char ch) { return ch == ' ' || ch == '\n' || ch == '\r'; }

/// \brief Append the source text between two scanner positions to the
/// normalized buffer and record where it came from.
///
/// The start position is the '>' that closed the preceding tag, the end
/// position the '<' that ends the text run. The retained text starts one byte
/// after the start position, with leading and trailing spaces and line breaks
/// removed.
///
/// \return false, with nothing appended, when either position does not resolve.
inline bool recordSpan(std::string_view source, std::size_t startLine, std::size_t startColumn,
                       std::size_t endLine, std::size_t endColumn, const PositionIndex &index,
                       std::string &buffer, std::vector<RangeMapping> &mappings)
{
  auto startOffset = index.resolve(startLine, startColumn);
  auto endOffset = index.resolve(endLine, endColumn);
  if (!startOffset || !endOffset)
  {
    return false;
  }

  std::size_t start = *startOffset + 1;
  std::size_t end = *endOffset;
  while (start < end && isBoundarySpace(source[start]))
  {
    ++start;
  }
  while (end > start + 1 && isBoundarySpace(source[end - 1]))
  {
    --end;
  }
  if (end < start)
  {
    end = start;
  }

  std::size_t length = end - start;
  RangeMapping mapping;
  mapping.originalRange = ByteRange{start, start + length};
  mapping.normalizedRange = ByteRange{buffer.size(), buffer.size() + length};
  mappings.push_back(mapping);
  buffer.append(source.substr(start, length));
  return true;
}

/// \brief Check every mapping against its source and normalized text.
/// \return index of the first mapping that does not hold, or std::nullopt.
inline std::optional<std::size_t> verifyMappings(std::string_view source,
                                                 std::string_view normalized,
                                                 const std::vector<RangeMapping> &mappings)
{
  for (std::size_t i = 0; i < mappings.size(); ++i)
  {
    const auto &m = mappings[i];
    if (m.originalRange.end > source.size() || m.normalizedRange.end > normalized.size() ||
        m.originalRange.begin > m.originalRange.end ||
        m.normalizedRange.begin > m.normalizedRange.end ||
        m.originalRange.size() != m.normalizedRange.size())
    {
      return i;
    }
    if (source.substr(m.originalRange.begin, m.originalRange.size()) !=
        normalized.substr(m.normalizedRange.begin, m.normalizedRange.size()))
    {
      return i;
    }
  }
  return std::nullopt;
}

} // namespace text
} // namespace xmlspan
