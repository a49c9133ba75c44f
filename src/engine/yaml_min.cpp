/*
TGTelex — Minimal YAML reader for settings files.
Copyright 2025-2026 Tamas Geczy.
Licensed under the MIT License. See LICENSE for details.
*/

#include "yaml_min.h"

#include <cctype>
#include <fstream>
#include <sstream>
#include <utility>
#include <vector>

namespace tgtelex::yaml_min {

namespace {

struct Line {
  int lineNo = 0;    // 1-based
  int indent = 0;    // leading spaces
  std::string text;  // no indent, no comment, no trailing blanks
};

std::string_view trimView(std::string_view s) {
  while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
  while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\r')) s.remove_suffix(1);
  return s;
}

// Cut at the first '#' outside quotes.
std::string_view dropComment(std::string_view s) {
  char quote = 0;
  for (std::size_t i = 0; i < s.size(); ++i) {
    const char c = s[i];
    if (quote) {
      if (c == quote) quote = 0;
    } else if (c == '"' || c == '\'') {
      quote = c;
    } else if (c == '#') {
      return s.substr(0, i);
    }
  }
  return s;
}

std::string unquote(std::string_view s) {
  if (s.size() < 2) return std::string(s);
  const char q = s.front();
  if ((q != '"' && q != '\'') || s.back() != q) return std::string(s);

  std::string out;
  out.reserve(s.size() - 2);
  for (std::size_t i = 1; i + 1 < s.size(); ++i) {
    const char c = s[i];
    if (q == '"' && c == '\\' && i + 2 < s.size()) {
      const char n = s[++i];
      switch (n) {
        case 'n': out.push_back('\n'); break;
        case 't': out.push_back('\t'); break;
        default: out.push_back(n); break;
      }
      continue;
    }
    out.push_back(c);
  }
  return out;
}

void splitLines(std::string_view text, std::vector<Line>& out) {
  if (text.size() >= 3 && static_cast<unsigned char>(text[0]) == 0xEF &&
      static_cast<unsigned char>(text[1]) == 0xBB &&
      static_cast<unsigned char>(text[2]) == 0xBF) {
    text.remove_prefix(3);
  }

  int lineNo = 0;
  std::size_t pos = 0;
  while (pos <= text.size()) {
    std::size_t end = text.find('\n', pos);
    if (end == std::string_view::npos) end = text.size();
    std::string_view raw = text.substr(pos, end - pos);
    pos = end + 1;
    ++lineNo;

    int indent = 0;
    while (indent < static_cast<int>(raw.size()) && raw[static_cast<std::size_t>(indent)] == ' ') ++indent;

    const std::string_view body = trimView(dropComment(raw.substr(static_cast<std::size_t>(indent))));
    if (body.empty()) continue;
    out.push_back(Line{lineNo, indent, std::string(body)});
  }
}

// "key: value" with the colon outside quotes. value may be empty.
bool splitKeyValue(const std::string& s, std::string& outKey, std::string& outVal) {
  char quote = 0;
  for (std::size_t i = 0; i < s.size(); ++i) {
    const char c = s[i];
    if (quote) {
      if (c == quote) quote = 0;
      continue;
    }
    if (c == '"' || c == '\'') {
      quote = c;
      continue;
    }
    if (c == ':' && (i + 1 == s.size() || s[i + 1] == ' ' || s[i + 1] == '\t')) {
      outKey = unquote(trimView(std::string_view(s).substr(0, i)));
      outVal = std::string(trimView(std::string_view(s).substr(i + 1)));
      return !outKey.empty();
    }
  }
  return false;
}

bool parseMap(const std::vector<Line>& lines, std::size_t& idx, int indent, Node& out,
              std::string& err) {
  out.type = Node::Type::Map;

  while (idx < lines.size()) {
    const Line& ln = lines[idx];
    if (ln.indent < indent) break;
    if (ln.indent > indent) {
      err = "unexpected indentation";
      return false;
    }
    if (ln.text[0] == '-') {
      err = "sequences are not supported";
      return false;
    }

    std::string key;
    std::string val;
    if (!splitKeyValue(ln.text, key, val)) {
      err = "expected 'key: value'";
      return false;
    }

    Node child;
    child.line = ln.lineNo;
    ++idx;
    if (!val.empty()) {
      child.type = Node::Type::Scalar;
      child.scalar = unquote(val);
    } else if (idx < lines.size() && lines[idx].indent > indent) {
      if (!parseMap(lines, idx, lines[idx].indent, child, err)) return false;
    }

    if (out.map.count(key)) {
      --idx;
      err = "duplicate key '" + key + "'";
      return false;
    }
    out.map.emplace(std::move(key), std::move(child));
  }
  return true;
}

}  // namespace

bool Node::asBool(bool& out) const {
  if (!isScalar()) return false;
  std::string s;
  s.reserve(scalar.size());
  for (char c : scalar) s.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  if (s == "true" || s == "yes" || s == "on" || s == "1") { out = true; return true; }
  if (s == "false" || s == "no" || s == "off" || s == "0") { out = false; return true; }
  return false;
}

std::string Node::asString(const std::string& fallback) const {
  if (!isScalar()) return fallback;
  return scalar;
}

const Node* Node::get(std::string_view key) const {
  if (!isMap()) return nullptr;
  auto it = map.find(std::string(key));
  if (it == map.end()) return nullptr;
  return &it->second;
}

bool loadText(std::string_view text, const std::string& sourceName, Node& outRoot,
              std::string& outError) {
  std::vector<Line> lines;
  splitLines(text, lines);

  outRoot = Node{};
  outRoot.type = Node::Type::Map;
  if (lines.empty()) return true;

  std::size_t idx = 0;
  std::string err;
  if (!parseMap(lines, idx, lines[0].indent, outRoot, err) || idx < lines.size()) {
    if (err.empty()) err = "unexpected indentation";
    const int lineNo = idx < lines.size() ? lines[idx].lineNo : lines.back().lineNo;
    std::ostringstream oss;
    oss << sourceName << ":" << lineNo << ": " << err;
    outError = oss.str();
    return false;
  }
  return true;
}

bool loadFile(const std::string& path, Node& outRoot, std::string& outError) {
  std::ifstream f(path, std::ios::binary);
  if (!f) {
    outError = "Could not open file: " + path;
    return false;
  }
  std::ostringstream buf;
  buf << f.rdbuf();
  return loadText(buf.str(), path, outRoot, outError);
}

} // namespace tgtelex::yaml_min
