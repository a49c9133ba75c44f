/*
TGTelex — Shared types and helpers for restore rules.
Copyright 2025-2026 Tamas Geczy.
Licensed under the MIT License. See LICENSE for details.
*/

#ifndef TGTELEX_ENGINE_RULES_RULE_COMMON_H
#define TGTELEX_ENGINE_RULES_RULE_COMMON_H

#include <string>
#include <vector>

#include "../composer.h"
#include "../key_class.h"
#include "../phonology.h"

namespace tgtelex {

// Outcome of the boundary classifier for one word.
enum class Verdict {
  Keep,
  Restore,
};

// Everything a rule may look at. Built once per word boundary.
struct RuleContext {
  const std::vector<KeyInfo>& keys;
  const Composition& comp;
  const std::u32string& rendered;
  bool decomposed = false;
  const Syllable& syllable;

  RuleContext(const std::vector<KeyInfo>& k, const Composition& c,
              const std::u32string& r, bool d, const Syllable& s)
      : keys(k), comp(c), rendered(r), decomposed(d), syllable(s) {}
};

// A rule returns true when the word must be restored to its raw keys.
using RuleFn = bool (*)(const RuleContext& ctx);

struct RuleDesc {
  const char* name = "";
  RuleFn fn = nullptr;
};

namespace rules {

// Lowercased raw keystrokes.
inline std::u32string lowerRaw(const std::vector<KeyInfo>& keys) {
  std::u32string out;
  out.reserve(keys.size());
  for (const KeyInfo& k : keys) out.push_back(k.lower);
  return out;
}

// Consonant letters before the first vowel, with the u of qu folded in.
// Returns false if the word has no vowel.
inline bool composedInitial(const Composition& comp, std::u32string& out) {
  const std::u32string spelled = comp.spelled();
  std::size_t n = 0;
  while (n < spelled.size() && !isVowelLetter(spelled[n])) ++n;
  if (n == spelled.size()) return false;
  out = spelled.substr(0, n);
  if (out == U"q" && spelled[n] == U'u') out = U"qu";
  return true;
}

}  // namespace rules

}  // namespace tgtelex

#endif  // TGTELEX_ENGINE_RULES_RULE_COMMON_H
