// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of XmlSpan, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <cctype>
#include <cstdint>
#include <fstream>
#include <map>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

/// \file minimal_toml.hpp
/// \brief Reader for the TOML subset used by XmlSpan configuration files:
/// [dotted.sections], bare keys, basic and literal strings, integers, floats,
/// booleans and single-line or multi-line arrays of scalars. No serializer.

namespace xmlspan
{
namespace parsers
{
namespace toml
{

class table;
struct value;

using array = std::vector<value>;

/// \brief A TOML value: scalar, array or nested table.
struct value
{
  using storage = std::variant<std::monostate, int64_t, double, bool, std::string,
                               std::shared_ptr<array>, std::shared_ptr<table>>;

  storage data;

  value() = default;
  value(int64_t v) : data(v) {}
  value(double v) : data(v) {}
  value(bool v) : data(v) {}
  value(std::string v) : data(std::move(v)) {}
  value(std::shared_ptr<array> v) : data(std::move(v)) {}
  value(std::shared_ptr<table> v) : data(std::move(v)) {}

  bool empty() const { return std::holds_alternative<std::monostate>(data); }
  bool is_table() const { return std::holds_alternative<std::shared_ptr<table>>(data); }
  bool is_array() const { return std::holds_alternative<std::shared_ptr<array>>(data); }

  /// \brief Typed access. Integers widen to double; nothing else converts.
  template <typename T> std::optional<T> as() const
  {
    if constexpr (std::is_same_v<T, double>)
    {
      if (auto *i = std::get_if<int64_t>(&data))
      {
        return static_cast<double>(*i);
      }
    }
    if (auto *v = std::get_if<T>(&data))
    {
      return *v;
    }
    return std::nullopt;
  }

  const array *as_array() const
  {
    auto *p = std::get_if<std::shared_ptr<array>>(&data);
    return p ? p->get() : nullptr;
  }

  const table *as_table() const
  {
    auto *p = std::get_if<std::shared_ptr<table>>(&data);
    return p ? p->get() : nullptr;
  }

  table *as_table()
  {
    auto *p = std::get_if<std::shared_ptr<table>>(&data);
    return p ? p->get() : nullptr;
  }
};

/// \brief Key/value table; keys are kept sorted.
class table
{
public:
  bool contains(const std::string &key) const { return _values.count(key) != 0; }
  bool empty() const { return _values.empty(); }
  std::size_t size() const { return _values.size(); }

  value &operator[](const std::string &key) { return _values[key]; }

  /// \brief Look up "a.b.c" through nested tables; returns an empty value if
  /// any component is missing.
  value at_path(const std::string &dottedPath) const
  {
    const table *current = this;
    std::size_t begin = 0;
    while (current)
    {
      std::size_t dot = dottedPath.find('.', begin);
      std::string part = dottedPath.substr(begin, dot == std::string::npos ? dot : dot - begin);
      auto it = current->_values.find(part);
      if (it == current->_values.end())
      {
        return value{};
      }
      if (dot == std::string::npos)
      {
        return it->second;
      }
      current = it->second.as_table();
      begin = dot + 1;
    }
    return value{};
  }

  auto begin() const { return _values.begin(); }
  auto end() const { return _values.end(); }

private:
  std::map<std::string, value> _values;
};

/// \brief Single-pass reader. Throws std::runtime_error with a line number on
/// malformed input.
class reader
{
public:
  explicit reader(std::string input) : _input(std::move(input)) {}

  table read()
  {
    table root;
    table *section = &root;
    while (skipBlankAndComments())
    {
      if (peek() == '[')
      {
        section = openSection(root, readSectionName());
      }
      else
      {
        std::string key = readKey();
        skipInlineSpace();
        expect('=');
        skipInlineSpace();
        if (section->contains(key))
        {
          fail("duplicate key '" + key + "'");
        }
        (*section)[key] = readValue();
      }
      skipInlineSpace();
      if (peek() == '#')
      {
        skipComment();
      }
      if (!atEnd() && peek() != '\n' && peek() != '\r')
      {
        fail("unexpected trailing characters");
      }
    }
    return root;
  }

private:
  std::string _input;
  std::size_t _pos{0};
  std::size_t _line{1};

  bool atEnd() const { return _pos >= _input.size(); }
  char peek() const { return atEnd() ? '\0' : _input[_pos]; }

  char get()
  {
    char c = _input[_pos++];
    if (c == '\n')
    {
      ++_line;
    }
    return c;
  }

  [[noreturn]] void fail(const std::string &what) const
  {
    throw std::runtime_error("TOML line " + std::to_string(_line) + ": " + what);
  }

  void expect(char c)
  {
    if (peek() != c)
    {
      fail(std::string("expected '") + c + "'");
    }
    get();
  }

  void skipInlineSpace()
  {
    while (peek() == ' ' || peek() == '\t')
    {
      get();
    }
  }

  void skipComment()
  {
    while (!atEnd() && peek() != '\n')
    {
      get();
    }
  }

  /// Returns false at end of input.
  bool skipBlankAndComments()
  {
    while (!atEnd())
    {
      char c = peek();
      if (c == '#')
      {
        skipComment();
      }
      else if (std::isspace(static_cast<unsigned char>(c)))
      {
        get();
      }
      else
      {
        return true;
      }
    }
    return false;
  }

  static bool isKeyChar(char c)
  {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-';
  }

  std::string readKey()
  {
    std::string key;
    while (isKeyChar(peek()))
    {
      key.push_back(get());
    }
    if (key.empty())
    {
      fail("expected key");
    }
    return key;
  }

  std::string readSectionName()
  {
    expect('[');
    std::string name;
    while (!atEnd() && peek() != ']' && peek() != '\n')
    {
      char c = get();
      if (c != ' ' && c != '\t')
      {
        name.push_back(c);
      }
    }
    expect(']');
    if (name.empty())
    {
      fail("empty section name");
    }
    return name;
  }

  table *openSection(table &root, const std::string &path)
  {
    table *current = &root;
    std::stringstream ss(path);
    std::string part;
    while (std::getline(ss, part, '.'))
    {
      value &slot = (*current)[part];
      if (slot.empty())
      {
        slot = value(std::make_shared<table>());
      }
      current = slot.as_table();
      if (!current)
      {
        fail("'" + path + "' is not a table");
      }
    }
    return current;
  }

  value readValue()
  {
    char c = peek();
    if (c == '"' || c == '\'')
    {
      return value(readString());
    }
    if (c == '[')
    {
      return value(readArray());
    }
    if (c == 't' || c == 'f')
    {
      return value(readBool());
    }
    if (c == '+' || c == '-' || std::isdigit(static_cast<unsigned char>(c)))
    {
      return readNumber();
    }
    fail("invalid value");
  }

  std::string readString()
  {
    char quote = get();
    std::string out;
    while (!atEnd() && peek() != quote && peek() != '\n')
    {
      char c = get();
      if (c == '\\' && quote == '"')
      {
        if (atEnd())
        {
          break;
        }
        char esc = get();
        switch (esc)
        {
        case 'n':
          out.push_back('\n');
          break;
        case 't':
          out.push_back('\t');
          break;
        case 'r':
          out.push_back('\r');
          break;
        case '"':
        case '\\':
          out.push_back(esc);
          break;
        default:
          fail(std::string("unknown escape '\\") + esc + "'");
        }
      }
      else
      {
        out.push_back(c);
      }
    }
    expect(quote);
    return out;
  }

  bool readBool()
  {
    std::string word;
    while (std::isalpha(static_cast<unsigned char>(peek())))
    {
      word.push_back(get());
    }
    if (word == "true")
    {
      return true;
    }
    if (word == "false")
    {
      return false;
    }
    fail("invalid boolean '" + word + "'");
  }

  value readNumber()
  {
    std::string num;
    bool isFloat = false;
    while (!atEnd())
    {
      char c = peek();
      if (c == '.' || c == 'e' || c == 'E')
      {
        isFloat = true;
      }
      else if (c == '_')
      {
        get();
        continue;
      }
      else if (!std::isdigit(static_cast<unsigned char>(c)) && c != '+' && c != '-')
      {
        break;
      }
      num.push_back(get());
    }
    try
    {
      if (isFloat)
      {
        return value(std::stod(num));
      }
      return value(static_cast<int64_t>(std::stoll(num)));
    }
    catch (const std::exception &)
    {
      fail("invalid number '" + num + "'");
    }
  }

  std::shared_ptr<array> readArray()
  {
    expect('[');
    auto arr = std::make_shared<array>();
    while (true)
    {
      skipBlankAndComments();
      if (peek() == ']')
      {
        break;
      }
      arr->push_back(readValue());
      skipBlankAndComments();
      if (peek() == ',')
      {
        get();
        continue;
      }
      if (peek() != ']')
      {
        fail("expected ',' or ']' in array");
      }
    }
    expect(']');
    return arr;
  }
};

inline table parse(const std::string &tomlString) { return reader(tomlString).read(); }

inline table parse_file(const std::string &filename)
{
  std::ifstream file(filename);
  if (!file.is_open())
  {
    throw std::runtime_error("Cannot open file: " + filename);
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  return parse(buffer.str());
}

} // namespace toml
} // namespace parsers
} // namespace xmlspan
