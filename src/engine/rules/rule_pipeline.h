/*
TGTelex — Restore classifier interface.
Copyright 2025-2026 Tamas Geczy.
Licensed under the MIT License. See LICENSE for details.
*/

#ifndef TGTELEX_ENGINE_RULES_RULE_PIPELINE_H
#define TGTELEX_ENGINE_RULES_RULE_PIPELINE_H

#include "rule_common.h"

namespace tgtelex {

struct Decision {
  Verdict verdict = Verdict::Keep;
  const char* rule = "";  // name of the rule that fired, empty on Keep
};

// Run the restore rules in order; the first one that fires decides.
Decision classifyWord(const RuleContext& ctx);

}  // namespace tgtelex

#endif  // TGTELEX_ENGINE_RULES_RULE_PIPELINE_H
