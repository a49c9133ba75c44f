/*
TGTelex — Minimal YAML reader for settings files.
Copyright 2025-2026 Tamas Geczy.
Licensed under the MIT License. See LICENSE for details.
*/

#ifndef TGTELEX_ENGINE_YAML_MIN_H
#define TGTELEX_ENGINE_YAML_MIN_H

#include <string>
#include <string_view>
#include <unordered_map>

namespace tgtelex::yaml_min {

struct Node {
  enum class Type {
    Null,
    Scalar,
    Map,
  };

  Type type = Type::Null;
  std::string scalar;  // unquoted text
  int line = 0;        // 1-based source line, 0 for the root

  std::unordered_map<std::string, Node> map;

  bool isScalar() const { return type == Type::Scalar; }
  bool isMap() const { return type == Type::Map; }

  // Typed scalar helpers. Return true on success.
  bool asBool(bool& out) const;
  std::string asString(const std::string& fallback = "") const;

  const Node* get(std::string_view key) const;
};

// Indentation-based subset: nested maps of "key: value" scalars, quoted or
// plain, with # comments. Sequences are not supported.
// On failure outError carries "<source>:<line>: <message>".
bool loadText(std::string_view text, const std::string& sourceName, Node& outRoot,
              std::string& outError);
bool loadFile(const std::string& path, Node& outRoot, std::string& outError);

} // namespace tgtelex::yaml_min

#endif
