/*
TGTelex — Restore rule for tone keys absorbed before a consonant.
Copyright 2025-2026 Tamas Geczy.
Licensed under the MIT License. See LICENSE for details.
*/

#ifndef TGTELEX_ENGINE_RULES_ABSORBED_MODIFIER_H
#define TGTELEX_ENGINE_RULES_ABSORBED_MODIFIER_H

#include "rule_common.h"

namespace tgtelex::rules {

// "test", "most": s was taken as a tone, yet the next key is a consonant the
// s could only have formed a cluster with. Words whose nucleus carries a
// Telex mark (muwowjt) are deliberate Vietnamese and never fire.
bool ruleToneBeforeConsonant(const RuleContext& ctx);

}  // namespace tgtelex::rules

#endif  // TGTELEX_ENGINE_RULES_ABSORBED_MODIFIER_H
