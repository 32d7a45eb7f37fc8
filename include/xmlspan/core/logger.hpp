// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of XmlSpan, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <chrono>
#include <ctime>
#include <fstream>
#include <functional>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <string>

namespace xmlspan
{
namespace core
{

namespace detail
{
  /// \brief Extract filename from full path at compile-time
  constexpr const char *basename(const char *path)
  {
    const char *file = path;
    while (*path)
    {
      if (*path == '/' || *path == '\\')
      {
        file = path + 1;
      }
      ++path;
    }
    return file;
  }
} // namespace detail

class LoggerStream;

/// \brief Thread-safe synchronous logger with levels, optional file output
/// and an optional external handler.
class Logger
{
public:
  enum class Level
  {
    Trace,
    Debug,
    Info,
    Warning,
    Error,
    Fatal
  };

  /// \brief External log handler function type
  /// Takes log level, formatted message, and original message without timestamp/level prefix
  using ExternalHandler = std::function<void(Level level, const std::string &formattedMessage,
                                             const std::string &rawMessage)>;

  struct Endl
  {
  };
  static inline constexpr Endl endl{};

  /// \brief Set the minimum level and the output file. An empty path logs to stdout.
  static void init(Level level = Level::Info, const std::string &filePath = "",
                   const std::string &timeFormat = "%Y-%m-%d %H:%M:%S")
  {
    auto &data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);

    data.minLevel = level;
    data.timestampFormat = timeFormat;
    data.fileStream.reset();
    if (!filePath.empty())
    {
      data.fileStream = std::make_unique<std::ofstream>(filePath, std::ios::app);
      if (!data.fileStream->is_open())
      {
        std::cerr << "[Logger] Failed to open log file: " << filePath << std::endl;
        data.fileStream.reset();
      }
    }
  }

  static void flush()
  {
    auto &data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);
    if (data.fileStream)
    {
      data.fileStream->flush();
    }
    else
    {
      std::cout.flush();
    }
  }

  /// \brief Flush and close the log file, returning output to stdout.
  static void shutdown()
  {
    flush();
    auto &data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);
    data.fileStream.reset();
  }

  static void setLevel(Level level)
  {
    auto &data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);
    data.minLevel = level;
  }

  static Level level()
  {
    auto &data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);
    return data.minLevel;
  }

  /// \brief Register an external log handler
  /// When an external handler is registered, file and console output are disabled
  static void setExternalHandler(ExternalHandler handler)
  {
    auto &data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);
    data.externalHandler = std::move(handler);
  }

  static void clearExternalHandler()
  {
    auto &data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);
    data.externalHandler = nullptr;
  }

  static void trace(const std::string &message) { log(Level::Trace, message); }
  static void debug(const std::string &message) { log(Level::Debug, message); }
  static void info(const std::string &message) { log(Level::Info, message); }
  static void warning(const std::string &message) { log(Level::Warning, message); }
  static void error(const std::string &message) { log(Level::Error, message); }
  static void fatal(const std::string &message) { log(Level::Fatal, message); }

  static LoggerStream stream(Level level);

  static void log(Level level, const std::string &message)
  {
    log(level, message, nullptr, 0, nullptr);
  }

  /// \brief Log a message with source location information
  /// \param file Source file name (from __FILE__), may be nullptr
  /// \param line Source line number (from __LINE__)
  /// \param function Function name (from __func__), may be nullptr
  static void log(Level level, const std::string &message, const char *file, int line,
                  const char *function)
  {
    auto &data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);
    if (level < data.minLevel)
    {
      return;
    }

    std::string output = formatLogMessage(level, message, file, line, function,
                                          data.timestampFormat);
    if (data.externalHandler)
    {
      data.externalHandler(level, output, message);
    }
    else if (data.fileStream)
    {
      (*data.fileStream) << output;
      data.fileStream->flush();
    }
    else
    {
      std::cout << output;
    }
  }

  static const char *levelToString(Level level)
  {
    switch (level)
    {
    case Level::Trace:
      return "TRACE";
    case Level::Debug:
      return "DEBUG";
    case Level::Info:
      return "INFO";
    case Level::Warning:
      return "WARN";
    case Level::Error:
      return "ERROR";
    case Level::Fatal:
      return "FATAL";
    default:
      return "UNKNOWN";
    }
  }

  /// \brief Parse a level name as used in configuration files.
  /// \throws std::invalid_argument for an unknown name
  static Level levelFromString(const std::string &name)
  {
    std::string lower;
    for (char c : name)
    {
      lower.push_back(static_cast<char>((c >= 'A' && c <= 'Z') ? c - 'A' + 'a' : c));
    }
    if (lower == "trace")
      return Level::Trace;
    if (lower == "debug")
      return Level::Debug;
    if (lower == "info")
      return Level::Info;
    if (lower == "warning" || lower == "warn")
      return Level::Warning;
    if (lower == "error")
      return Level::Error;
    if (lower == "fatal")
      return Level::Fatal;
    throw std::invalid_argument("Unknown log level: " + name);
  }

private:
  struct LoggerData
  {
    Level minLevel = Level::Info;
    std::unique_ptr<std::ofstream> fileStream;
    std::string timestampFormat = "%Y-%m-%d %H:%M:%S";
    ExternalHandler externalHandler;
    std::mutex mutex;
  };

  static LoggerData &getData()
  {
    static LoggerData data;
    return data;
  }

  static std::string timestamp(const std::string &format)
  {
    auto now = std::chrono::system_clock::now();
    std::time_t t = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    localtime_r(&t, &tm);
    std::ostringstream ss;
    ss << std::put_time(&tm, format.c_str());
    return ss.str();
  }

  static std::string formatLogMessage(Level level, const std::string &message, const char *file,
                                      int line, const char *function,
                                      const std::string &timestampFormat)
  {
    std::ostringstream os;
    os << "[" << timestamp(timestampFormat) << "] [" << levelToString(level) << "] ";
    if (file)
    {
      os << "[" << detail::basename(file) << ":" << line;
      if (function)
      {
        os << " " << function;
      }
      os << "] ";
    }
    os << message << "\n";
    return os.str();
  }
};

/// \brief Stream interface for composing and emitting log messages with
/// levels.
class LoggerStream
{
public:
  explicit LoggerStream(Logger::Level level) : _level(level), _flushed(false) {}

  template <typename T> LoggerStream &operator<<(const T &value)
  {
    _stream << value;
    return *this;
  }

  LoggerStream &operator<<(Logger::Endl)
  {
    flush();
    return *this;
  }

  ~LoggerStream()
  {
    if (!_flushed && !_stream.str().empty())
    {
      flush();
    }
  }

private:
  Logger::Level _level;
  std::ostringstream _stream;
  bool _flushed;

  void flush()
  {
    Logger::log(_level, _stream.str());
    _flushed = true;
  }
};

/// \brief Proxy for streaming log messages at specific log levels.
class LoggerProxy
{
public:
  LoggerStream operator<<(Logger::Level level) { return Logger::stream(level); }
};

inline LoggerProxy Logger;

#define XMLSPAN_LOG_WITH_LEVEL(level, msg)                                                         \
  do                                                                                               \
  {                                                                                                \
    std::ostringstream _oss;                                                                       \
    _oss << msg;                                                                                   \
    xmlspan::core::Logger::log(xmlspan::core::Logger::Level::level, _oss.str(), __FILE__,         \
                               __LINE__, __func__);                                                \
  } while (0)

#define XMLSPAN_LOG_TRACE(msg) XMLSPAN_LOG_WITH_LEVEL(Trace, msg)
#define XMLSPAN_LOG_DEBUG(msg) XMLSPAN_LOG_WITH_LEVEL(Debug, msg)
#define XMLSPAN_LOG_INFO(msg) XMLSPAN_LOG_WITH_LEVEL(Info, msg)
#define XMLSPAN_LOG_WARN(msg) XMLSPAN_LOG_WITH_LEVEL(Warning, msg)
#define XMLSPAN_LOG_ERROR(msg) XMLSPAN_LOG_WITH_LEVEL(Error, msg)
#define XMLSPAN_LOG_FATAL(msg) XMLSPAN_LOG_WITH_LEVEL(Fatal, msg)

inline LoggerStream Logger::stream(Logger::Level level) { return LoggerStream(level); }
} // namespace core
} // namespace xmlspan
