// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of XmlSpan, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <xmlspan/core/logger.hpp>
#include <xmlspan/options.hpp>
#include <xmlspan/parsers/minimal_toml.hpp>

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace xmlspan
{
namespace core
{
/// \brief Loads a TOML configuration file and maps its [parser] and [log]
/// tables onto ParserOptions and the Logger.
class ConfigLoader
{
public:
  /// \brief Constructs and loads a TOML configuration file.
  /// \throws std::runtime_error if the file cannot be read or parsed
  explicit ConfigLoader(const std::string &filename) : _filename(filename) { load(); }

  /// \brief Build from TOML text already in memory.
  static ConfigLoader fromString(const std::string &toml)
  {
    ConfigLoader loader;
    loader._table = parsers::toml::parse(toml);
    loader._loaded = true;
    return loader;
  }

  /// \brief Reloads the configuration from disk. Keeps the previous table on failure.
  bool reload()
  {
    try
    {
      _table = parsers::toml::parse_file(_filename);
      _loaded = true;
      return true;
    }
    catch (const std::runtime_error &e)
    {
      XMLSPAN_LOG_ERROR("Failed to load configuration " << _filename << ": " << e.what());
      return false;
    }
  }

  const parsers::toml::table &load()
  {
    if (!_loaded && !reload())
    {
      throw std::runtime_error("Failed to load configuration file: " + _filename);
    }
    return _table;
  }

  bool isLoaded() const { return _loaded; }

  /// \brief Gets the full configuration table.
  const parsers::toml::table &table() const { return _table; }

  /// \brief Gets a typed value from the configuration.
  /// \tparam T int64_t, double, bool or std::string
  template <typename T> std::optional<T> get(const std::string &dottedKey) const
  {
    return _table.at_path(dottedKey).as<T>();
  }

  std::optional<int64_t> getInt(const std::string &key) const { return get<int64_t>(key); }

  std::optional<bool> getBool(const std::string &key) const { return get<bool>(key); }

  std::optional<std::string> getString(const std::string &key) const
  {
    return get<std::string>(key);
  }

  /// \brief Gets an array of strings from the configuration.
  /// \throws std::runtime_error if the key is an array but any element is not a string
  std::optional<std::vector<std::string>> getStringArray(const std::string &key) const
  {
    auto node = _table.at_path(key);
    const auto *arr = node.as_array();
    if (!arr)
    {
      return std::nullopt;
    }
    std::vector<std::string> result;
    for (const auto &elem : *arr)
    {
      auto s = elem.as<std::string>();
      if (!s)
      {
        throw std::runtime_error("ConfigLoader: Array element at '" + key + "' is not a string");
      }
      result.push_back(*s);
    }
    return result;
  }

  /// \brief ParserOptions from the [parser] table; absent keys keep their defaults.
  /// \throws std::runtime_error when a key holds a value of the wrong type or range
  ParserOptions parserOptions() const
  {
    ParserOptions opt;
    if (auto trimWs = require<bool>("parser.trim_whitespace"); trimWs && *trimWs)
    {
      opt.trimming = ParserOptions::whitespaceAndNewlines();
    }
    if (auto trimming = require<std::string>("parser.trimming"))
    {
      opt.trimming = *trimming;
    }
    if (auto v = require<bool>("parser.ignore_namespaces"))
    {
      opt.ignoreNamespaces = *v;
    }
    if (auto v = require<std::string>("parser.paragraph_element"))
    {
      opt.paragraphElement = *v;
    }
    if (auto v = require<std::string>("parser.line_break_element"))
    {
      opt.lineBreakElement = *v;
    }
    if (auto v = require<bool>("parser.verify_provenance"))
    {
      opt.verifyProvenance = *v;
    }
    readLimit("parser.max_depth", opt.maxDepth);
    readLimit("parser.max_attributes", opt.maxAttributesPerElement);
    readLimit("parser.max_name_length", opt.maxNameLength);
    readLimit("parser.max_text_span", opt.maxTextSpan);
    return opt;
  }

  /// \brief Log level from [log].level, if present.
  /// \throws std::invalid_argument for an unknown level name
  std::optional<Logger::Level> logLevel() const
  {
    if (auto name = require<std::string>("log.level"))
    {
      return Logger::levelFromString(*name);
    }
    return std::nullopt;
  }

  /// \brief Initialize the Logger from the [log] table.
  void applyLogging() const
  {
    auto level = logLevel().value_or(Logger::Level::Info);
    auto file = require<std::string>("log.file").value_or("");
    Logger::init(level, file);
  }

private:
  ConfigLoader() = default;

  /// Like get<T>() but a present key of another type is an error.
  template <typename T> std::optional<T> require(const std::string &dottedKey) const
  {
    auto node = _table.at_path(dottedKey);
    if (node.empty())
    {
      return std::nullopt;
    }
    auto v = node.as<T>();
    if (!v)
    {
      throw std::runtime_error("ConfigLoader: '" + dottedKey + "' has the wrong type");
    }
    return v;
  }

  void readLimit(const std::string &dottedKey, std::size_t &out) const
  {
    if (auto v = require<int64_t>(dottedKey))
    {
      if (*v <= 0)
      {
        throw std::runtime_error("ConfigLoader: '" + dottedKey + "' must be positive");
      }
      out = static_cast<std::size_t>(*v);
    }
  }

  std::string _filename;
  parsers::toml::table _table;
  bool _loaded{false};
};

} // namespace core
} // namespace xmlspan
