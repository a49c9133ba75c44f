/*
TGTelex — Structural restore rules (decomposition, initial).
Copyright 2025-2026 Tamas Geczy.
Licensed under the MIT License. See LICENSE for details.
*/

#include "structural.h"

namespace tgtelex::rules {

bool ruleUndecomposable(const RuleContext& ctx) {
  return !ctx.decomposed;
}

bool ruleInvalidInitial(const RuleContext& ctx) {
  std::u32string initial;
  if (!composedInitial(ctx.comp, initial)) return false;
  return !isValidInitial(initial);
}

}  // namespace tgtelex::rules
