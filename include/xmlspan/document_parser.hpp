// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of XmlSpan, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <xmlspan/core/logger.hpp>
#include <xmlspan/error.hpp>
#include <xmlspan/options.hpp>
#include <xmlspan/parse_result.hpp>
#include <xmlspan/parsers/xml_scanner.hpp>
#include <xmlspan/tree/tree_builder.hpp>

#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>

namespace xmlspan
{
/// \brief Parses XML source into a ParseResult: element tree, normalized
/// text and provenance mappings.
///
/// Holds only options. Every parse() call builds its own scanner, position
/// index and tree builder, so one DocumentParser can serve concurrent callers.
class DocumentParser
{
public:
  explicit DocumentParser(ParserOptions options = ParserOptions{}) : _options(std::move(options))
  {
  }

  const ParserOptions &options() const { return _options; }

  ParseResult parse(std::string_view source) const
  {
    tree::TreeBuilder builder(source, _options);
    parsers::XmlScanner scanner(source, _options);
    if (!parsers::runScanner(scanner, [&builder](const tree::ScanEvent &event)
                             { builder.apply(event); }))
    {
      XMLSPAN_LOG_DEBUG("Scanner stopped at offset " << scanner.error()->offset);
    }
    ParseResult result = builder.finish();
    if (!result.ok())
    {
      XMLSPAN_LOG_WARN("XML parse failed: " << result.error()->describe());
    }
    return result;
  }

  /// \brief Read a whole file and parse it. An unreadable file is reported
  /// as an InterruptedParse error.
  ParseResult parseFile(const std::string &path) const
  {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open())
    {
      ParseError err;
      err.message = "cannot open '" + path + "': " + std::strerror(errno);
      XMLSPAN_LOG_WARN(err.describe());
      return ParseResult::failure(std::move(err));
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    // The result refers to no part of the source, so a local buffer is fine.
    std::string source = buffer.str();
    XMLSPAN_LOG_DEBUG("Parsing " << path << " (" << source.size() << " bytes)");
    return parse(source);
  }

private:
  ParserOptions _options;
};

/// \brief Parse with default or given options.
inline ParseResult parse(std::string_view source, const ParserOptions &options = ParserOptions{})
{
  return DocumentParser(options).parse(source);
}

} // namespace xmlspan
