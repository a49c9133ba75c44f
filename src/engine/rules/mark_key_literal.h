/*
TGTelex — Restore rule for w used as a plain letter.
Copyright 2025-2026 Tamas Geczy.
Licensed under the MIT License. See LICENSE for details.
*/

#ifndef TGTELEX_ENGINE_RULES_MARK_KEY_LITERAL_H
#define TGTELEX_ENGINE_RULES_MARK_KEY_LITERAL_H

#include "rule_common.h"

namespace tgtelex::rules {

// Word starts with w + consonant, or a w after a vowel stayed a letter.
bool ruleLiteralW(const RuleContext& ctx);

}  // namespace tgtelex::rules

#endif  // TGTELEX_ENGINE_RULES_MARK_KEY_LITERAL_H
