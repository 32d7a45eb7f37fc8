// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of XmlSpan, which is licensed under the Mozilla Public License 2.0.
// See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for details.

#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>
#include "xmlspan_test_helpers.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>

using xmlspan::core::Logger;

TEST_CASE("Logger writes every enabled level to its file", "[logger][levels]")
{
  const std::string logFile = "xmlspan_testlog.log";
  std::filesystem::remove(logFile);

  Logger::init(Logger::Level::Trace, logFile);
  XMLSPAN_LOG_TRACE("Trace message");
  XMLSPAN_LOG_DEBUG("Debug message");
  XMLSPAN_LOG_INFO("Info message");
  XMLSPAN_LOG_WARN("Warn message");
  XMLSPAN_LOG_ERROR("Error message");
  XMLSPAN_LOG_FATAL("Fatal message");
  Logger::shutdown();

  std::ifstream in(logFile);
  REQUIRE(in.is_open());
  std::string contents((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  REQUIRE(std::count(contents.begin(), contents.end(), '\n') == 6);
  REQUIRE(contents.find("[WARN]") != std::string::npos);
  REQUIRE(contents.find("xmlspan_test_logger.cpp:") != std::string::npos);
  in.close();
  std::filesystem::remove(logFile);
  Logger::init(Logger::Level::Info);
}

TEST_CASE("Logger filters below the minimum level", "[logger][levels]")
{
  xmlspan::test::LogCapture capture(Logger::Level::Warning);
  XMLSPAN_LOG_INFO("dropped");
  XMLSPAN_LOG_WARN("kept " << 42);
  Logger::error("plain error");

  REQUIRE_FALSE(capture.contains(Logger::Level::Info, "dropped"));
  REQUIRE(capture.contains(Logger::Level::Warning, "kept 42"));
  REQUIRE(capture.contains(Logger::Level::Error, "plain error"));
}

TEST_CASE("Logger stream syntax", "[logger][stream]")
{
  xmlspan::test::LogCapture capture(Logger::Level::Info);
  xmlspan::core::Logger << Logger::Level::Info << "Stream log test: " << 123 << Logger::endl;
  REQUIRE(capture.contains(Logger::Level::Info, "Stream log test: 123"));
}

TEST_CASE("Logger external handler receives formatted and raw text", "[logger][external]")
{
  std::string formatted;
  std::string raw;
  Logger::setLevel(Logger::Level::Info);
  Logger::setExternalHandler(
    [&](Logger::Level, const std::string &f, const std::string &r)
    {
      formatted = f;
      raw = r;
    });
  XMLSPAN_LOG_INFO("handled");
  Logger::clearExternalHandler();

  REQUIRE(raw == "handled");
  REQUIRE(formatted.find("[INFO]") != std::string::npos);
  REQUIRE(formatted.find("handled\n") != std::string::npos);
}

TEST_CASE("Logger level names", "[logger][config]")
{
  REQUIRE(Logger::levelFromString("DEBUG") == Logger::Level::Debug);
  REQUIRE(Logger::levelFromString("warn") == Logger::Level::Warning);
  REQUIRE(Logger::levelFromString("fatal") == Logger::Level::Fatal);
  REQUIRE_THROWS_AS(Logger::levelFromString("loud"), std::invalid_argument);
  REQUIRE(std::string(Logger::levelToString(Logger::Level::Error)) == "ERROR");
}
