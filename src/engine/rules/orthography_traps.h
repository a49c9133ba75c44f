/*
TGTelex — Orthography-trap restore rule and its allow-list.
Copyright 2025-2026 Tamas Geczy.
Licensed under the MIT License. See LICENSE for details.
*/

#ifndef TGTELEX_ENGINE_RULES_ORTHOGRAPHY_TRAPS_H
#define TGTELEX_ENGINE_RULES_ORTHOGRAPHY_TRAPS_H

#include <string_view>

#include "rule_common.h"

namespace tgtelex::rules {

enum class TrapShape {
  ToneSplitsNucleus,  // co-r-e
  ToneAfterNucleus,   // pai-r
};

// A valid syllable that English spellings produce far more often than
// Vietnamese typists do.
struct OrthographyTrap {
  std::u32string_view nucleus;
  TrapShape shape = TrapShape::ToneSplitsNucleus;
  char32_t toneKey = 0;           // 0 = any tone key
  std::u32string_view initials;   // space separated, "-" = none, "*" = any
};

// Raw spellings (lowercase) that match a trap but are real Vietnamese.
bool isTrapAllowListed(std::u32string_view rawLower);

bool ruleOrthographyTrap(const RuleContext& ctx);

}  // namespace tgtelex::rules

#endif  // TGTELEX_ENGINE_RULES_ORTHOGRAPHY_TRAPS_H
