/*
TGTelex — Structural restore rules (decomposition, initial).
Copyright 2025-2026 Tamas Geczy.
Licensed under the MIT License. See LICENSE for details.
*/

#ifndef TGTELEX_ENGINE_RULES_STRUCTURAL_H
#define TGTELEX_ENGINE_RULES_STRUCTURAL_H

#include "rule_common.h"

namespace tgtelex::rules {

// The composed letters do not form a valid syllable.
bool ruleUndecomposable(const RuleContext& ctx);

// The consonants before the first vowel are not a Vietnamese initial (f, w, ...).
bool ruleInvalidInitial(const RuleContext& ctx);

}  // namespace tgtelex::rules

#endif  // TGTELEX_ENGINE_RULES_STRUCTURAL_H
