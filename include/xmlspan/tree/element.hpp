// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of XmlSpan, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace xmlspan
{
namespace tree
{
class TreeBuilder;

/// \brief One XML element. Children are owned; the parent link is not.
///
/// Elements are only created and mutated by TreeBuilder, and only while open
/// (on the builder's stack). Once closed they are read-only.
class Element
{
public:
  using AttributeMap = std::map<std::string, std::string>;

  static constexpr const char *kRootName = "xmlspan.DocumentRoot";

  const std::string &name() const { return _name; }
  const AttributeMap &attributes() const { return _attributes; }
  const std::vector<std::unique_ptr<Element>> &children() const { return _children; }
  const Element *parent() const { return _parent; }
  const std::optional<std::string> &rawText() const { return _rawText; }
  const std::optional<std::string> &cdata() const { return _cdata; }
  std::size_t lineStart() const { return _lineStart; }
  std::size_t lineEnd() const { return _lineEnd; }
  bool isClosed() const { return _closed; }
  bool isRoot() const { return _parent == nullptr; }

  /// \brief Value of an attribute, if present.
  std::optional<std::string_view> attribute(std::string_view attrName) const
  {
    auto it = _attributes.find(std::string(attrName));
    if (it == _attributes.end())
    {
      return std::nullopt;
    }
    return std::string_view(it->second);
  }

  /// \brief First direct child with the given name; nullptr if none.
  const Element *childByName(std::string_view childName) const
  {
    for (const auto &c : _children)
    {
      if (c->_name == childName)
      {
        return c.get();
      }
    }
    return nullptr;
  }

  /// \brief All direct children with the given name, in document order.
  std::vector<const Element *> childrenByName(std::string_view childName) const
  {
    std::vector<const Element *> out;
    for (const auto &c : _children)
    {
      if (c->_name == childName)
      {
        out.push_back(c.get());
      }
    }
    return out;
  }

  /// \brief Number of elements in this subtree, excluding this one.
  std::size_t descendantCount() const
  {
    std::size_t n = _children.size();
    for (const auto &c : _children)
    {
      n += c->descendantCount();
    }
    return n;
  }

  /// \brief Same name, attributes, text, CDATA, line span and shape.
  bool structurallyEquals(const Element &other) const
  {
    if (_name != other._name || _attributes != other._attributes || _rawText != other._rawText ||
        _cdata != other._cdata || _lineStart != other._lineStart || _lineEnd != other._lineEnd ||
        _children.size() != other._children.size())
    {
      return false;
    }
    for (std::size_t i = 0; i < _children.size(); ++i)
    {
      if (!_children[i]->structurallyEquals(*other._children[i]))
      {
        return false;
      }
    }
    return true;
  }

private:
  friend class TreeBuilder;

  explicit Element(std::string name) : _name(std::move(name)) {}

  std::string _name;
  AttributeMap _attributes;
  std::vector<std::unique_ptr<Element>> _children;
  Element *_parent{nullptr};
  std::optional<std::string> _rawText;
  std::optional<std::string> _cdata;
  std::size_t _lineStart{0};
  std::size_t _lineEnd{0};
  bool _closed{false};
};

} // namespace tree
} // namespace xmlspan
