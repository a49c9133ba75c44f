/*
TGTelex — Orthography-trap restore rule and its allow-list.
Copyright 2025-2026 Tamas Geczy.
Licensed under the MIT License. See LICENSE for details.
*/

#include "orthography_traps.h"

namespace tgtelex::rules {

namespace {

const OrthographyTrap kTraps[] = {
    // core, more, store, hose
    {U"oe", TrapShape::ToneSplitsNucleus, 0, U"*"},
    // pair
    {U"ai", TrapShape::ToneAfterNucleus, U'r', U"- p"},
};

const std::u32string_view kAllowList[] = {
    U"air",    // ải
    U"khore",  // khỏe
    U"hofe",   // hòe
    U"lofe",   // lòe
    U"nhofe",  // nhòe
    U"tofe",   // tòe
    U"xofe",   // xòe
};

bool initialListed(std::u32string_view list, std::u32string_view initial) {
  std::size_t pos = 0;
  while (pos <= list.size()) {
    std::size_t end = list.find(U' ', pos);
    if (end == std::u32string_view::npos) end = list.size();
    const std::u32string_view item = list.substr(pos, end - pos);
    if (item == U"*") return true;
    if (item == U"-" && initial.empty()) return true;
    if (!item.empty() && item != U"-" && item == initial) return true;
    pos = end + 1;
  }
  return false;
}

bool toneBetween(const RuleContext& ctx, int fromKey, int toKey) {
  for (int i = fromKey + 1; i < toKey; ++i) {
    if (ctx.comp.uses[static_cast<std::size_t>(i)] == KeyUse::Tone) return true;
  }
  return false;
}

bool matches(const OrthographyTrap& trap, const RuleContext& ctx) {
  const Syllable& syl = ctx.syllable;
  if (syl.nucleus != trap.nucleus) return false;
  if (!initialListed(trap.initials, syl.initial)) return false;

  const std::size_t start = syl.nucleusStart();
  const auto& letters = ctx.comp.letters;

  switch (trap.shape) {
    case TrapShape::ToneSplitsNucleus:
      for (std::size_t i = start; i + 1 < start + syl.nucleus.size(); ++i) {
        if (toneBetween(ctx, letters[i].key, letters[i + 1].key)) return true;
      }
      return false;
    case TrapShape::ToneAfterNucleus: {
      const int last = static_cast<int>(ctx.keys.size()) - 1;
      if (ctx.comp.toneKey != last) return false;
      if (trap.toneKey != 0 && ctx.keys[static_cast<std::size_t>(last)].lower != trap.toneKey) {
        return false;
      }
      return letters[start + syl.nucleus.size() - 1].key < last;
    }
  }
  return false;
}

}  // namespace

bool isTrapAllowListed(std::u32string_view rawLower) {
  for (std::u32string_view w : kAllowList) {
    if (w == rawLower) return true;
  }
  return false;
}

bool ruleOrthographyTrap(const RuleContext& ctx) {
  if (!ctx.decomposed || ctx.syllable.pattern == nullptr) return false;
  for (const OrthographyTrap& trap : kTraps) {
    if (!matches(trap, ctx)) continue;
    if (isTrapAllowListed(lowerRaw(ctx.keys))) return false;
    return true;
  }
  return false;
}

}  // namespace tgtelex::rules
