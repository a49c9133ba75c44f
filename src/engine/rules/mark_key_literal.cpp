/*
TGTelex — Restore rule for w used as a plain letter.
Copyright 2025-2026 Tamas Geczy.
Licensed under the MIT License. See LICENSE for details.
*/

#include "mark_key_literal.h"

namespace tgtelex::rules {

bool ruleLiteralW(const RuleContext& ctx) {
  const auto& keys = ctx.keys;
  if (keys.size() >= 2 && keys[0].lower == U'w' && keys[1].cls != KeyClass::Vowel) {
    return true;
  }

  bool seenVowel = false;
  for (const ComposedLetter& l : ctx.comp.letters) {
    const KeyInfo& k = keys[static_cast<std::size_t>(l.key)];
    if (k.lower == U'w' && seenVowel) return true;
    if (l.isVowel()) seenVowel = true;
  }
  return false;
}

}  // namespace tgtelex::rules
