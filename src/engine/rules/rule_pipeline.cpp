/*
TGTelex — Restore rule registration and execution.
Copyright 2025-2026 Tamas Geczy.
Licensed under the MIT License. See LICENSE for details.
*/

#include "rule_pipeline.h"

#include "absorbed_modifier.h"
#include "mark_key_literal.h"
#include "orthography_traps.h"
#include "structural.h"

namespace tgtelex {

namespace {

// Every word caught by invalid_initial or literal_w also fails to
// decompose (neither a bad initial nor a letter w fits a syllable), so in
// this order undecomposable always reports them first. They stay listed as
// named rules and are tested on their own.
const RuleDesc kRules[] = {
    {"undecomposable", &rules::ruleUndecomposable},
    {"tone_before_consonant", &rules::ruleToneBeforeConsonant},
    {"invalid_initial", &rules::ruleInvalidInitial},
    {"literal_w", &rules::ruleLiteralW},
    {"orthography_trap", &rules::ruleOrthographyTrap},
};

}  // namespace

Decision classifyWord(const RuleContext& ctx) {
  Decision d;
  for (const auto& rule : kRules) {
    if (rule.fn == nullptr) continue;
    if (rule.fn(ctx)) {
      d.verdict = Verdict::Restore;
      d.rule = rule.name;
      return d;
    }
  }
  return d;
}

}  // namespace tgtelex
