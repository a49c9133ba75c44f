/*
TGTelex — Engine settings and their YAML loader.
Copyright 2025-2026 Tamas Geczy.
Licensed under the MIT License. See LICENSE for details.
*/

#include "settings.h"

#include <cctype>

namespace tgtelex {

static std::string valueError(const char* key, const yaml_min::Node& n, const char* expected) {
  return std::string(key) + " (line " + std::to_string(n.line) + "): expected " + expected +
         ", got '" + n.scalar + "'";
}

static bool readBool(const yaml_min::Node& root, const char* key, bool& out, std::string& err) {
  const yaml_min::Node* n = root.get(key);
  if (!n) return true;
  if (!n->asBool(out)) {
    err = valueError(key, *n, "a boolean");
    return false;
  }
  return true;
}

static bool parseToneStyle(std::string s, ToneStyle& out) {
  for (char& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  if (s == "traditional" || s == "old") {
    out = ToneStyle::Traditional;
    return true;
  }
  if (s == "modern" || s == "new") {
    out = ToneStyle::Modern;
    return true;
  }
  return false;
}

bool applySettings(const yaml_min::Node& root, EngineSettings& inOut, std::string& outError) {
  if (!root.isMap()) {
    outError = "settings root must be a map";
    return false;
  }

  EngineSettings s = inOut;
  if (!readBool(root, "enabled", s.enabled, outError)) return false;
  if (!readBool(root, "autoRestore", s.autoRestore, outError)) return false;
  if (!readBool(root, "rawPrefix", s.rawPrefix, outError)) return false;
  if (!readBool(root, "debugLog", s.debugLog, outError)) return false;

  if (const yaml_min::Node* n = root.get("autocorrect")) {
    if (!parseAutoCorrectMode(n->asString(), s.autocorrect)) {
      outError = valueError("autocorrect", *n, "off, vietnamese, english, all or 0-3");
      return false;
    }
  }
  if (const yaml_min::Node* n = root.get("toneStyle")) {
    if (!parseToneStyle(n->asString(), s.toneStyle)) {
      outError = valueError("toneStyle", *n, "traditional or modern");
      return false;
    }
  }

  inOut = s;
  return true;
}

bool loadSettingsText(std::string_view text, EngineSettings& inOut, std::string& outError) {
  yaml_min::Node root;
  if (!yaml_min::loadText(text, "<settings>", root, outError)) return false;
  return applySettings(root, inOut, outError);
}

bool loadSettingsFile(const std::string& path, EngineSettings& inOut, std::string& outError) {
  yaml_min::Node root;
  if (!yaml_min::loadFile(path, root, outError)) return false;
  if (!applySettings(root, inOut, outError)) {
    outError = path + ": " + outError;
    return false;
  }
  return true;
}

} // namespace tgtelex
