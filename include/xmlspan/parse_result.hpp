// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of XmlSpan, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <xmlspan/error.hpp>
#include <xmlspan/text/text_normalizer.hpp>
#include <xmlspan/tree/element.hpp>

#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace xmlspan
{
/// \brief A completed parse: synthetic root, normalized text and its provenance.
struct Document
{
  std::unique_ptr<tree::Element> root;
  std::string text;
  std::vector<text::RangeMapping> mappings;
};

/// \brief Outcome of a parse: either a Document or the ParseError that
/// interrupted it, never both.
class ParseResult
{
public:
  static ParseResult success(Document document) { return ParseResult(std::move(document)); }
  static ParseResult failure(ParseError error) { return ParseResult(std::move(error)); }

  bool ok() const { return std::holds_alternative<Document>(_value); }
  explicit operator bool() const { return ok(); }

  /// \brief Returns the error, or nullptr on success.
  const ParseError *error() const { return std::get_if<ParseError>(&_value); }

  /// \brief Returns the document, or nullptr on failure.
  const Document *document() const { return std::get_if<Document>(&_value); }

  /// \throws std::logic_error on a failed result
  const tree::Element &root() const { return *checked().root; }
  const std::string &text() const { return checked().text; }
  const std::vector<text::RangeMapping> &mappings() const { return checked().mappings; }

private:
  explicit ParseResult(Document document) : _value(std::move(document)) {}
  explicit ParseResult(ParseError error) : _value(std::move(error)) {}

  const Document &checked() const
  {
    const Document *doc = document();
    if (!doc)
    {
      throw std::logic_error("ParseResult: no document, parse failed: " + error()->describe());
    }
    return *doc;
  }

  std::variant<ParseError, Document> _value;
};

} // namespace xmlspan
