// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of XmlSpan, which is licensed under the Mozilla Public License 2.0.
// See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for details.

#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>
#include "xmlspan_test_helpers.hpp"

#include <filesystem>
#include <fstream>
#include <string>
#include <thread>
#include <vector>

using namespace xmlspan;
using xmlspan::test::slice;

namespace
{
const std::string kReport = "<?xml version=\"1.0\"?>\n"
                            "<doc>\n"
                            "  <title>Report</title>\n"
                            "  <p>First   line\n"
                            "     continues here</p>\n"
                            "  <p>Second &amp; last</p>\n"
                            "  <br/>\n"
                            "  <footer>\n"
                            "    end\n"
                            "  </footer>\n"
                            "</doc>\n";

void requireConsistent(const std::string &source, const ParseResult &result)
{
  REQUIRE(result.ok());
  for (const auto &m : result.mappings())
  {
    REQUIRE(slice(result.text(), m.normalizedRange) == slice(source, m.originalRange));
  }
  REQUIRE_FALSE(text::verifyMappings(source, result.text(), result.mappings()).has_value());
}
} // namespace

TEST_CASE("DocumentParser scenarios", "[parser][scenario]")
{
  DocumentParser parser;

  SECTION("Paragraphs are separated by one line break")
  {
    std::string xml = "<root><p>Hello</p><p>World</p></root>";
    auto result = parser.parse(xml);
    requireConsistent(xml, result);
    REQUIRE(result.text() == "Hello\nWorld");
    const auto *root = result.root().childByName("root");
    REQUIRE(root != nullptr);
    REQUIRE(root->childrenByName("p").size() == 2);
  }

  SECTION("Structural whitespace is not normalized text")
  {
    std::string xml = "<root>  <a>x</a>  </root>";
    auto result = parser.parse(xml);
    requireConsistent(xml, result);
    REQUIRE(result.text() == "x");
    REQUIRE(result.mappings().size() == 1);
    REQUIRE(result.root().childByName("root")->rawText().value() == "    ");
  }

  SECTION("Mismatched close tag yields only an error")
  {
    auto result = parser.parse("<root><a></root>");
    REQUIRE_FALSE(result.ok());
    REQUIRE(result.document() == nullptr);
    REQUIRE(result.error()->kind == ErrorKind::InterruptedParse);
    REQUIRE(result.error()->describe().find("mismatched end tag") != std::string::npos);
  }

  SECTION("Attributes")
  {
    auto result = parser.parse("<item id=\"7\" lang=\"en\"/>");
    REQUIRE(result.ok());
    const auto *item = result.root().childByName("item");
    REQUIRE(item != nullptr);
    REQUIRE(item->attributes() == tree::Element::AttributeMap{{"id", "7"}, {"lang", "en"}});
    REQUIRE(item->children().empty());
  }

  SECTION("CDATA")
  {
    auto result = parser.parse("<note><![CDATA[raw & unescaped]]></note>");
    REQUIRE(result.ok());
    const auto *note = result.root().childByName("note");
    REQUIRE(note->cdata().value() == "raw & unescaped");
    REQUIRE(result.text().empty());
    REQUIRE(result.mappings().empty());
  }
}

TEST_CASE("DocumentParser on a pretty-printed document", "[parser][provenance]")
{
  ParserOptions opt;
  opt.trimming = ParserOptions::whitespaceAndNewlines();
  auto result = DocumentParser(opt).parse(kReport);
  requireConsistent(kReport, result);

  REQUIRE(result.text() == "Report\n"
                           "First   line\n     continues here\n"
                           "Second &amp; last\n"
                           "end");
  REQUIRE(result.mappings().size() == 4);
  REQUIRE(slice(kReport, result.mappings()[3].originalRange) == "end");

  const auto *doc = result.root().childByName("doc");
  REQUIRE(doc->lineStart() == 2);
  REQUIRE(doc->lineEnd() == 11);
  auto paragraphs = doc->childrenByName("p");
  REQUIRE(paragraphs.size() == 2);
  // Raw text is entity-decoded and trimmed; normalized text is source text.
  REQUIRE(paragraphs[1]->rawText().value() == "Second & last");
  REQUIRE(paragraphs[0]->lineStart() == 4);
  REQUIRE(paragraphs[0]->lineEnd() == 5);
  REQUIRE(doc->childByName("footer")->rawText().value() == "end");
  REQUIRE(doc->rawText().value().empty());
}

TEST_CASE("DocumentParser is idempotent", "[parser][idempotence]")
{
  DocumentParser parser;
  auto first = parser.parse(kReport);
  auto second = parser.parse(kReport);
  REQUIRE(first.ok());
  REQUIRE(second.ok());
  REQUIRE(first.root().structurallyEquals(second.root()));
  REQUIRE(first.text() == second.text());
  REQUIRE(first.mappings() == second.mappings());
}

TEST_CASE("DocumentParser closes every element it opens", "[parser][structure]")
{
  auto result = parse("<a><b><c>1</c></b><d/></a>");
  REQUIRE(result.ok());

  std::vector<const tree::Element *> pending{&result.root()};
  std::size_t seen = 0;
  while (!pending.empty())
  {
    const tree::Element *e = pending.back();
    pending.pop_back();
    REQUIRE(e->isClosed());
    for (const auto &child : e->children())
    {
      REQUIRE(child->parent() == e);
      pending.push_back(child.get());
    }
    ++seen;
  }
  REQUIRE(seen == 5);
}

TEST_CASE("DocumentParser parses concurrently without shared state", "[parser][concurrency]")
{
  DocumentParser parser;
  auto reference = parser.parse(kReport);
  REQUIRE(reference.ok());

  std::vector<std::string> texts(8);
  std::vector<std::size_t> mappingCounts(8);
  std::vector<std::thread> workers;
  for (std::size_t i = 0; i < texts.size(); ++i)
  {
    workers.emplace_back(
      [&, i]()
      {
        auto r = parser.parse(kReport);
        texts[i] = r.ok() ? r.text() : std::string("<failed>");
        mappingCounts[i] = r.ok() ? r.mappings().size() : 0;
      });
  }
  for (auto &t : workers)
  {
    t.join();
  }
  for (std::size_t i = 0; i < texts.size(); ++i)
  {
    REQUIRE(texts[i] == reference.text());
    REQUIRE(mappingCounts[i] == reference.mappings().size());
  }
}

TEST_CASE("DocumentParser options", "[parser][options]")
{
  SECTION("Namespaces")
  {
    std::string xml = "<x:doc xmlns:x=\"urn:x\"><x:p>a</x:p></x:doc>";
    ParserOptions opt;
    opt.ignoreNamespaces = true;
    auto result = parse(xml, opt);
    REQUIRE(result.ok());
    const auto *doc = result.root().childByName("doc");
    REQUIRE(doc != nullptr);
    REQUIRE(doc->attribute("xmlns:x").value() == "urn:x");
    REQUIRE(doc->childByName("p") != nullptr);
    REQUIRE(result.text() == "a");

    auto qualified = parse(xml);
    REQUIRE(qualified.root().childByName("x:doc") != nullptr);
  }

  SECTION("Verification logs nothing on a well-formed parse")
  {
    ParserOptions opt;
    opt.verifyProvenance = true;
    xmlspan::test::LogCapture logs;
    auto result = parse(kReport, opt);
    REQUIRE(result.ok());
    REQUIRE(logs.count(core::Logger::Level::Error) == 0);
  }
}

TEST_CASE("DocumentParser failures", "[parser][error]")
{
  xmlspan::test::LogCapture logs(core::Logger::Level::Warning);

  SECTION("Unclosed document")
  {
    auto result = parse("<a><b>text</b>");
    REQUIRE_FALSE(result.ok());
    REQUIRE(result.error()->message.find("unclosed") != std::string::npos);
    REQUIRE(logs.contains(core::Logger::Level::Warning, "XML parse failed"));
  }

  SECTION("Error position is reported")
  {
    auto result = parse("<a>\n<b x=1/></a>");
    REQUIRE_FALSE(result.ok());
    REQUIRE(result.error()->line == 2);
    REQUIRE_THROWS_AS(result.mappings(), std::logic_error);
  }
}

TEST_CASE("DocumentParser parseFile", "[parser][file]")
{
  const std::string path = "xmlspan_test_document.xml";
  {
    std::ofstream out(path, std::ios::binary);
    out << kReport;
  }

  DocumentParser parser;
  auto fromFile = parser.parseFile(path);
  auto fromMemory = parser.parse(kReport);
  REQUIRE(fromFile.ok());
  REQUIRE(fromFile.text() == fromMemory.text());
  REQUIRE(fromFile.mappings() == fromMemory.mappings());
  std::filesystem::remove(path);

  auto missing = parser.parseFile("does_not_exist.xml");
  REQUIRE_FALSE(missing.ok());
  REQUIRE(missing.error()->message.find("does_not_exist.xml") != std::string::npos);
}
