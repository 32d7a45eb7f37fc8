// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of XmlSpan, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once
/// \file xml_scanner.hpp
/// \brief Non-validating XML 1.0 scanner producing the five tree-building
/// events (element start/end, characters, CDATA, parse failure).
///
/// Position contract for the events it produces:
///  - ElementStart / ElementEnd: line and column of the tag's closing '>'.
///    A self-closing tag yields both events at its '>'.
///  - Characters: line and column of the '<' that ends the text run.
///
/// Comments, processing instructions, the XML declaration and DOCTYPE are
/// consumed without producing events. No external entity expansion.
///
/// Example:
/// \code
/// xmlspan::parsers::XmlScanner scanner(source);
/// while (scanner.next())
/// {
///   builder.apply(scanner.current());
/// }
/// \endcode

#include <xmlspan/error.hpp>
#include <xmlspan/options.hpp>
#include <xmlspan/tree/scan_event.hpp>

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace xmlspan
{
namespace parsers
{
/// \brief Pull scanner over a contiguous UTF-8 buffer. Columns count bytes.
class XmlScanner
{
public:
  XmlScanner(std::string_view input, const ParserOptions &opt = ParserOptions{})
      : _input(input), _opt(opt)
  {
  }

  /// \brief Advance to the next event. Returns false once the input is
  /// exhausted, or after the ParseFailure event has been produced.
  bool next()
  {
    if (_pendingEnd)
    {
      _event = std::move(*_pendingEnd);
      _pendingEnd.reset();
      return true;
    }
    if (_hasError)
    {
      if (_errorReported)
      {
        return false;
      }
      _errorReported = true;
      _event = tree::ParseFailure{_error};
      return true;
    }
    if (_done)
    {
      return false;
    }

    while (true)
    {
      if (_depth == 0)
      {
        skipSpaces();
      }
      if (eof())
      {
        finishDocument();
        return next();
      }

      if (peek() != '<')
      {
        if (!readText())
        {
          return next();
        }
        return true;
      }

      advance();
      if (eof())
      {
        fail("unexpected end after '<'");
        return next();
      }
      char n = peek();
      bool produced = false;
      bool ok = true;
      if (n == '?')
      {
        advance();
        ok = skipProcessingInstruction();
      }
      else if (n == '!')
      {
        advance();
        if (matchString("--"))
        {
          ok = skipUntil("-->", "unterminated comment");
        }
        else if (matchString("[CDATA["))
        {
          ok = readCData();
          produced = ok;
        }
        else if (matchWordCaseInsensitive("DOCTYPE"))
        {
          ok = skipDoctype();
        }
        else
        {
          ok = fail("unsupported markup declaration");
        }
      }
      else if (n == '/')
      {
        advance();
        ok = readEndTag();
        produced = ok;
      }
      else
      {
        ok = readStartOrEmptyTag();
        produced = ok;
      }

      if (!ok)
      {
        return next();
      }
      if (produced)
      {
        return true;
      }
    }
  }

  /// \brief The event produced by the last successful next().
  const tree::ScanEvent &current() const { return _event; }

  /// \brief Returns the error if scanning failed (nullptr if none).
  const ParseError *error() const { return _hasError ? &_error : nullptr; }

  /// \brief Decode predefined entities and numeric char refs in a slice.
  /// \return false on an unterminated, unknown or invalid reference; errOffset
  /// receives the offset within the slice.
  static bool decodeEntities(std::string_view in, std::string &out, std::size_t *errOffset = nullptr,
                             std::string *errMessage = nullptr)
  {
    out.clear();
    out.reserve(in.size());
    auto reject = [&](std::size_t at, const char *why)
    {
      if (errOffset)
      {
        *errOffset = at;
      }
      if (errMessage)
      {
        *errMessage = why;
      }
      return false;
    };
    for (std::size_t i = 0; i < in.size();)
    {
      char ch = in[i];
      if (ch != '&')
      {
        out.push_back(ch);
        ++i;
        continue;
      }
      std::size_t semi = in.find(';', i + 1);
      if (semi == std::string_view::npos)
      {
        return reject(i, "unterminated entity reference");
      }
      std::string_view ent = in.substr(i + 1, semi - (i + 1));
      if (ent == "lt")
        out.push_back('<');
      else if (ent == "gt")
        out.push_back('>');
      else if (ent == "amp")
        out.push_back('&');
      else if (ent == "apos")
        out.push_back('\'');
      else if (ent == "quot")
        out.push_back('"');
      else if (!ent.empty() && ent[0] == '#')
      {
        if (!appendCharRef(ent, out))
        {
          return reject(i, "invalid character reference");
        }
      }
      else
      {
        return reject(i, "unknown entity reference");
      }
      i = semi + 1;
    }
    return true;
  }

private:
  // ===== Low-level cursor helpers =====
  bool eof() const { return _cur >= _input.size(); }

  char peek() const { return _input[_cur]; }

  char get()
  {
    char ch = _input[_cur++];
    if (ch == '\n')
    {
      ++_line;
      _col = 1;
    }
    else
    {
      ++_col;
    }
    return ch;
  }

  void advance() { (void)get(); }

  static bool isSpace(char ch) { return ch == ' ' || ch == '\t' || ch == '\r' || ch == '\n'; }

  static bool isNameStart(char ch)
  {
    return (ch == ':' || ch == '_' || (ch >= 'A' && ch <= 'Z') || (ch >= 'a' && ch <= 'z') ||
            static_cast<unsigned char>(ch) >= 0x80);
  }

  static bool isNameChar(char ch)
  {
    return isNameStart(ch) || (ch == '-' || ch == '.' || (ch >= '0' && ch <= '9'));
  }

  void skipSpaces()
  {
    while (!eof() && isSpace(peek()))
    {
      advance();
    }
  }

  bool matchString(const char *s)
  {
    std::size_t i = 0;
    while (s[i] != '\0')
    {
      if (_cur + i >= _input.size() || _input[_cur + i] != s[i])
      {
        return false;
      }
      ++i;
    }
    for (std::size_t j = 0; j < i; ++j)
    {
      advance();
    }
    return true;
  }

  bool matchWordCaseInsensitive(const char *s)
  {
    std::size_t i = 0;
    while (s[i] != '\0')
    {
      if (_cur + i >= _input.size())
      {
        return false;
      }
      char a = _input[_cur + i];
      char b = s[i];
      if (a >= 'a' && a <= 'z')
      {
        a = static_cast<char>(a - 'a' + 'A');
      }
      if (b >= 'a' && b <= 'z')
      {
        b = static_cast<char>(b - 'a' + 'A');
      }
      if (a != b)
      {
        return false;
      }
      ++i;
    }
    char following = (_cur + i < _input.size() ? _input[_cur + i] : '\0');
    if (!(isSpace(following) || following == '>' || following == '['))
    {
      return false;
    }
    for (std::size_t j = 0; j < i; ++j)
    {
      advance();
    }
    return true;
  }

  /// Returns an empty view (and may set an error) if no valid name is present.
  std::string_view readName()
  {
    std::size_t start = _cur;
    if (eof() || !isNameStart(peek()))
    {
      return std::string_view{};
    }
    advance();
    while (!eof() && isNameChar(peek()))
    {
      advance();
    }
    std::size_t len = _cur - start;
    if (len > _opt.maxNameLength)
    {
      fail("name too long");
      return std::string_view{};
    }
    return _input.substr(start, len);
  }

  /// Advance past the next occurrence of endSeq, setting [start, start+len) to
  /// the skipped content.
  bool readUntil(std::string_view endSeq, std::size_t &startOut, std::size_t &lenOut)
  {
    std::size_t pos = _input.find(endSeq, _cur);
    if (pos == std::string_view::npos)
    {
      return false;
    }
    startOut = _cur;
    lenOut = pos - _cur;
    while (_cur < pos + endSeq.size())
    {
      advance();
    }
    return true;
  }

  bool skipUntil(std::string_view endSeq, const char *unterminated)
  {
    std::size_t start = 0;
    std::size_t len = 0;
    if (!readUntil(endSeq, start, len))
    {
      return fail(unterminated);
    }
    return true;
  }

  bool skipProcessingInstruction()
  {
    if (readName().empty())
    {
      return _hasError ? false : fail("invalid processing instruction target");
    }
    return skipUntil("?>", "unterminated processing instruction");
  }

  bool skipDoctype()
  {
    // Up to the next '>' outside an internal subset.
    int bracket = 0;
    while (!eof())
    {
      char ch = get();
      if (ch == '[')
      {
        ++bracket;
      }
      else if (ch == ']' && bracket > 0)
      {
        --bracket;
      }
      else if (ch == '>' && bracket == 0)
      {
        return true;
      }
    }
    return fail("unterminated doctype");
  }

  bool readQuotedValue(std::string_view &out)
  {
    if (eof())
    {
      return fail("expected quote");
    }
    char quote = peek();
    if (quote != '"' && quote != '\'')
    {
      return fail("expected '\"' or '\\'' for attribute value");
    }
    advance();
    std::size_t start = _cur;
    while (!eof() && peek() != quote)
    {
      if (peek() == '<')
      {
        return fail("'<' not allowed in attribute value");
      }
      advance();
    }
    if (eof())
    {
      return fail("unterminated attribute value");
    }
    std::size_t end = _cur;
    advance();
    out = _input.substr(start, end - start);
    if (out.size() > _opt.maxTextSpan)
    {
      return fail("attribute value too long");
    }
    return true;
  }

  bool readAttributes(std::map<std::string, std::string> &attrs)
  {
    while (true)
    {
      bool spaced = !eof() && isSpace(peek());
      skipSpaces();
      if (eof())
      {
        return fail("unexpected end in attributes");
      }
      char ch = peek();
      if (ch == '/' || ch == '>')
      {
        return true;
      }
      if (!spaced)
      {
        return fail("expected whitespace before attribute");
      }
      std::size_t nameOffset = _cur;
      std::string_view name = readName();
      if (name.empty())
      {
        return _hasError ? false : fail("invalid attribute name");
      }
      skipSpaces();
      if (eof() || peek() != '=')
      {
        return fail("expected '=' after attribute name");
      }
      advance();
      skipSpaces();
      std::string_view raw;
      if (!readQuotedValue(raw))
      {
        return false;
      }
      std::string decoded;
      std::string why;
      if (!decodeEntities(raw, decoded, nullptr, &why))
      {
        return fail(why.c_str());
      }
      if (!attrs.emplace(std::string(name), std::move(decoded)).second)
      {
        _cur = nameOffset;
        return fail("duplicate attribute");
      }
      if (attrs.size() > _opt.maxAttributesPerElement)
      {
        return fail("too many attributes");
      }
    }
  }

  bool readCData()
  {
    std::size_t start = 0;
    std::size_t len = 0;
    if (!readUntil("]]>", start, len))
    {
      return fail("unterminated CDATA section");
    }
    if (_depth == 0)
    {
      return fail("CDATA section outside the root element");
    }
    _event = tree::CData{std::string(_input.substr(start, len))};
    return true;
  }

  bool readEndTag()
  {
    std::string_view name = readName();
    if (name.empty())
    {
      return _hasError ? false : fail("invalid end tag name");
    }
    skipSpaces();
    if (eof() || peek() != '>')
    {
      return fail("expected '>' after end tag name");
    }
    std::size_t line = _line;
    std::size_t col = _col;
    advance();

    if (_elementStack.empty())
    {
      return fail("end tag without matching start tag");
    }
    if (_elementStack.back() != name)
    {
      std::string msg = "mismatched end tag - expected </" + _elementStack.back() + "> but got </" +
                        std::string(name) + ">";
      return fail(msg.c_str());
    }

    _elementStack.pop_back();
    --_depth;
    if (_depth == 0)
    {
      _rootClosed = true;
    }
    _event = tree::ElementEnd{std::string(name), line, col};
    return true;
  }

  bool readStartOrEmptyTag()
  {
    if (_rootClosed)
    {
      return fail("extra content after the document element");
    }
    std::string_view name = readName();
    if (name.empty())
    {
      return _hasError ? false : fail("invalid start tag name");
    }
    tree::ElementStart start;
    start.name = std::string(name);
    if (!readAttributes(start.attributes))
    {
      return false;
    }

    bool empty = false;
    if (peek() == '/')
    {
      empty = true;
      advance();
    }
    if (eof() || peek() != '>')
    {
      return fail("expected '>' to end start tag");
    }
    start.line = _line;
    start.column = _col;
    advance();

    if (_depth + 1 > _opt.maxDepth)
    {
      return fail("maximum element depth exceeded");
    }

    if (empty)
    {
      if (_depth == 0)
      {
        _rootClosed = true;
      }
      _pendingEnd = tree::ElementEnd{start.name, start.line, start.column};
    }
    else
    {
      ++_depth;
      _elementStack.push_back(start.name);
    }
    _event = std::move(start);
    return true;
  }

  bool readText()
  {
    std::size_t start = _cur;
    std::size_t startLine = _line;
    std::size_t startCol = _col;
    while (!eof() && peek() != '<')
    {
      if ((_cur - start) >= _opt.maxTextSpan)
      {
        return fail("text span too large");
      }
      advance();
    }
    std::string_view raw = _input.substr(start, _cur - start);
    if (_depth == 0)
    {
      _cur = start;
      _line = startLine;
      _col = startCol;
      return fail(_rootClosed ? "extra content after the document element"
                              : "text before the document element");
    }
    std::string decoded;
    std::size_t badAt = 0;
    std::string why;
    if (!decodeEntities(raw, decoded, &badAt, &why))
    {
      return failAt(start + badAt, why.c_str());
    }
    _event = tree::Characters{std::move(decoded), _line, _col};
    return true;
  }

  void finishDocument()
  {
    if (!_elementStack.empty())
    {
      std::string unclosed = "unclosed elements at end of document:";
      for (const auto &elem : _elementStack)
      {
        unclosed += " <" + elem + ">";
      }
      fail(unclosed.c_str());
      return;
    }
    if (!_rootClosed)
    {
      fail("document is empty");
      return;
    }
    _done = true;
  }

  bool fail(const char *msg)
  {
    if (_hasError)
    {
      return false;
    }
    _hasError = true;
    _error.kind = ErrorKind::InterruptedParse;
    _error.offset = _cur;
    _error.line = _line;
    _error.column = _col;
    _error.message = msg;
    return false;
  }

  /// Fail at an earlier offset, recomputing line and column.
  bool failAt(std::size_t offset, const char *msg)
  {
    std::size_t line = 1;
    std::size_t col = 1;
    for (std::size_t i = 0; i < offset && i < _input.size(); ++i)
    {
      if (_input[i] == '\n')
      {
        ++line;
        col = 1;
      }
      else
      {
        ++col;
      }
    }
    fail(msg);
    _error.offset = offset;
    _error.line = line;
    _error.column = col;
    return false;
  }

  // Append a numeric char ref (e.g. "#10" or "#x1F4A9") to out as UTF-8.
  static bool appendCharRef(std::string_view entBody, std::string &out)
  {
    if (entBody.size() < 2)
    {
      return false;
    }
    uint32_t code = 0;
    bool hex = (entBody[1] == 'x' || entBody[1] == 'X');
    std::size_t first = hex ? 2 : 1;
    if (first >= entBody.size())
    {
      return false;
    }
    for (std::size_t i = first; i < entBody.size(); ++i)
    {
      char c = entBody[i];
      uint32_t v = 0;
      if (c >= '0' && c <= '9')
      {
        v = static_cast<uint32_t>(c - '0');
      }
      else if (hex && c >= 'a' && c <= 'f')
      {
        v = static_cast<uint32_t>(c - 'a' + 10);
      }
      else if (hex && c >= 'A' && c <= 'F')
      {
        v = static_cast<uint32_t>(c - 'A' + 10);
      }
      else
      {
        return false;
      }
      code = hex ? (code << 4) | v : code * 10u + v;
      if (code > 0x10FFFFu)
      {
        return false;
      }
    }
    return encodeUtf8(code, out);
  }

  static bool encodeUtf8(uint32_t cp, std::string &out)
  {
    if (cp == 0 || (cp >= 0xD800u && cp <= 0xDFFFu) || cp > 0x10FFFFu)
    {
      return false;
    }
    if (cp <= 0x7Fu)
    {
      out.push_back(static_cast<char>(cp));
    }
    else if (cp <= 0x7FFu)
    {
      out.push_back(static_cast<char>(0xC0u | ((cp >> 6) & 0x1Fu)));
      out.push_back(static_cast<char>(0x80u | (cp & 0x3Fu)));
    }
    else if (cp <= 0xFFFFu)
    {
      out.push_back(static_cast<char>(0xE0u | ((cp >> 12) & 0x0Fu)));
      out.push_back(static_cast<char>(0x80u | ((cp >> 6) & 0x3Fu)));
      out.push_back(static_cast<char>(0x80u | (cp & 0x3Fu)));
    }
    else
    {
      out.push_back(static_cast<char>(0xF0u | ((cp >> 18) & 0x07u)));
      out.push_back(static_cast<char>(0x80u | ((cp >> 12) & 0x3Fu)));
      out.push_back(static_cast<char>(0x80u | ((cp >> 6) & 0x3Fu)));
      out.push_back(static_cast<char>(0x80u | (cp & 0x3Fu)));
    }
    return true;
  }

private:
  std::string_view _input;
  ParserOptions _opt{};

  std::size_t _cur{0};
  std::size_t _line{1};
  std::size_t _col{1};
  std::size_t _depth{0};

  tree::ScanEvent _event{};
  std::optional<tree::ElementEnd> _pendingEnd;

  bool _hasError{false};
  bool _errorReported{false};
  ParseError _error{};
  bool _done{false};
  bool _rootClosed{false};
  std::vector<std::string> _elementStack{};
};

/// \brief Drive a handler with every event of a scan, failure included.
/// \return true if the scan completed without error.
template <typename Handler> bool runScanner(XmlScanner &scanner, Handler &&handler)
{
  while (scanner.next())
  {
    handler(scanner.current());
  }
  return scanner.error() == nullptr;
}

} // namespace parsers
} // namespace xmlspan
