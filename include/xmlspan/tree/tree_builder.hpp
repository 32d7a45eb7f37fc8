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
#include <xmlspan/text/position_index.hpp>
#include <xmlspan/text/text_normalizer.hpp>
#include <xmlspan/tree/element.hpp>
#include <xmlspan/tree/scan_event.hpp>

#include <cstddef>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace xmlspan
{
namespace tree
{
/// \brief Builds the element tree and the normalized text from scanner
/// events, one event at a time.
///
/// All state belongs to one builder, and a builder serves one parse: events
/// must be applied in document order, then finish() is called once. The
/// source text must outlive the builder.
class TreeBuilder
{
public:
  TreeBuilder(std::string_view source, const ParserOptions &options = ParserOptions{})
      : _source(source), _options(options), _index(text::PositionIndex::build(source)),
        _root(new Element(Element::kRootName))
  {
    _stack.push_back(_root.get());
  }

  TreeBuilder(const TreeBuilder &) = delete;
  TreeBuilder &operator=(const TreeBuilder &) = delete;

  /// \brief Apply one scanner event.
  /// \throws std::logic_error if called after finish()
  void apply(const ScanEvent &event)
  {
    if (_finished)
    {
      throw std::logic_error("TreeBuilder: event applied after finish()");
    }
    std::visit([this](const auto &e) { on(e); }, event);
  }

  /// \brief End of document: the error if one was seen or elements are still
  /// open, otherwise the document. The builder is spent afterwards.
  ParseResult finish()
  {
    if (_finished)
    {
      throw std::logic_error("TreeBuilder: finish() called twice");
    }
    _finished = true;

    if (_error)
    {
      XMLSPAN_LOG_DEBUG("Parse interrupted: " << _error->describe());
      return ParseResult::failure(std::move(*_error));
    }
    if (_stack.size() > 1)
    {
      ParseError err;
      err.message = "unclosed element <" + _stack.back()->name() + "> at end of document";
      return ParseResult::failure(std::move(err));
    }

    _root->_closed = true;
    if (_options.verifyProvenance)
    {
      if (auto bad = text::verifyMappings(_source, _text, _mappings))
      {
        const auto &m = _mappings[*bad];
        XMLSPAN_LOG_ERROR("Provenance mismatch at mapping " << *bad << ": original ["
                                                            << m.originalRange.begin << ", "
                                                            << m.originalRange.end
                                                            << ") normalized ["
                                                            << m.normalizedRange.begin << ", "
                                                            << m.normalizedRange.end << ")");
      }
    }

    XMLSPAN_LOG_DEBUG("Parsed " << _root->descendantCount() << " elements, " << _text.size()
                                << " bytes of normalized text, " << _mappings.size()
                                << " mappings");
    Document doc;
    doc.root = std::move(_root);
    doc.text = std::move(_text);
    doc.mappings = std::move(_mappings);
    return ParseResult::success(std::move(doc));
  }

  bool hasError() const { return _error.has_value(); }

  /// \brief Open elements, excluding the synthetic root.
  std::size_t depth() const { return _stack.size() - 1; }

  const std::string &normalizedText() const { return _text; }
  const std::vector<text::RangeMapping> &mappings() const { return _mappings; }
  const text::PositionIndex &positionIndex() const { return _index; }

private:
  void on(const ElementStart &e)
  {
    auto node = std::unique_ptr<Element>(new Element(elementName(e.name)));
    node->_lineStart = e.line;
    node->_attributes = e.attributes;

    Element *parent = _stack.back();
    node->_parent = parent;
    Element *raw = node.get();
    parent->_children.push_back(std::move(node));
    _stack.push_back(raw);

    // Text after this tag is measured from its '>'.
    _start = Position{e.line, e.column};

    if (raw->_name == _options.paragraphElement && !_text.empty())
    {
      _text.push_back('\n');
    }
    if (raw->_name == _options.lineBreakElement)
    {
      _text.push_back('\n');
    }
  }

  void on(const Characters &e)
  {
    Element *top = _stack.back();
    if (top->_rawText)
    {
      top->_rawText->append(e.chunk);
    }
    else
    {
      top->_rawText = e.chunk;
    }

    if (isBlank(e.chunk) || !_start)
    {
      return;
    }
    if (!text::recordSpan(_source, _start->line, _start->column, e.line, e.column, _index, _text,
                          _mappings))
    {
      XMLSPAN_LOG_TRACE("No provenance for text ending at " << e.line << ":" << e.column
                                                            << ", position out of range");
    }
  }

  void on(const CData &e) { _stack.back()->_cdata = e.bytes; }

  void on(const ElementEnd &e)
  {
    if (_stack.size() <= 1)
    {
      ParseError err;
      err.message = "end tag </" + e.name + "> without matching start tag";
      err.line = e.line;
      err.column = e.column;
      recordError(std::move(err));
      return;
    }

    Element *top = _stack.back();
    top->_lineEnd = e.line;
    if (_options.trimming && top->_rawText)
    {
      top->_rawText = trim(*top->_rawText, *_options.trimming);
    }
    top->_closed = true;
    _stack.pop_back();

    // Text after a closed child is measured from the child's end tag, not
    // from the parent's start tag.
    _start = Position{e.line, e.column};
  }

  void on(const ParseFailure &e) { recordError(e.cause); }

  void recordError(ParseError err)
  {
    if (!_error)
    {
      _error = std::move(err);
    }
  }

  std::string elementName(const std::string &qualified) const
  {
    if (!_options.ignoreNamespaces)
    {
      return qualified;
    }
    std::size_t colon = qualified.rfind(':');
    return colon == std::string::npos ? qualified : qualified.substr(colon + 1);
  }

  static bool isBlank(std::string_view chunk)
  {
    return chunk.find_first_not_of(" \t\n\r\v\f") == std::string_view::npos;
  }

  static std::string trim(const std::string &s, const std::string &set)
  {
    std::size_t first = s.find_first_not_of(set);
    if (first == std::string::npos)
    {
      return std::string{};
    }
    std::size_t last = s.find_last_not_of(set);
    return s.substr(first, last - first + 1);
  }

  struct Position
  {
    std::size_t line;
    std::size_t column;
  };

  std::string_view _source;
  ParserOptions _options;
  text::PositionIndex _index;

  std::unique_ptr<Element> _root;
  std::vector<Element *> _stack; // bottom is _root; never empty

  std::optional<Position> _start;
  std::string _text;
  std::vector<text::RangeMapping> _mappings;
  std::optional<ParseError> _error;
  bool _finished{false};
};

} // namespace tree
} // namespace xmlspan
