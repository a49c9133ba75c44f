/*
TGTelex — Restore rule for tone keys absorbed before a consonant.
Copyright 2025-2026 Tamas Geczy.
Licensed under the MIT License. See LICENSE for details.
*/

#include "absorbed_modifier.h"

namespace tgtelex::rules {

namespace {

bool addedConsonant(const RuleContext& ctx, std::size_t i) {
  const KeyUse use = ctx.comp.uses[i];
  if (use != KeyUse::Letter && use != KeyUse::Literal) return false;
  return ctx.keys[i].cls != KeyClass::Vowel;
}

}  // namespace

bool ruleToneBeforeConsonant(const RuleContext& ctx) {
  if (ctx.comp.hasMarkedVowel()) return false;

  const std::size_t n = ctx.keys.size();
  for (std::size_t i = 0; i + 1 < n; ++i) {
    if (ctx.comp.uses[i] != KeyUse::Tone) continue;
    if (!addedConsonant(ctx, i + 1)) continue;

    const std::u32string cluster{ctx.keys[i].lower, ctx.keys[i + 1].lower};
    if (!isValidFinal(cluster)) return true;
  }
  return false;
}

}  // namespace tgtelex::rules
