/*
TGTelex — Restore classifier rule tests.
Copyright 2025-2026 Tamas Geczy.
Licensed under the MIT License. See LICENSE for details.
*/

#include <string>

#include <gtest/gtest.h>

#include "engine/rules/absorbed_modifier.h"
#include "engine/rules/mark_key_literal.h"
#include "engine/rules/orthography_traps.h"
#include "engine/rules/rule_pipeline.h"
#include "engine/rules/structural.h"
#include "engine/utf8.h"
#include "engine/word_buffer.h"

namespace tgtelex {
namespace {

// Owns the buffer a RuleContext points into.
struct Typed {
  WordBuffer buf;

  explicit Typed(const char* keys) {
    for (char32_t k : utf8ToU32(keys)) buf.push(classifyKey(k));
  }

  RuleContext ctx() const {
    return RuleContext(buf.keys(), buf.composition(), buf.rendered(), buf.decomposed(),
                       buf.syllable());
  }
};

std::string firedRule(const char* keys) {
  const Typed t(keys);
  const Decision d = classifyWord(t.ctx());
  return d.verdict == Verdict::Restore ? d.rule : "keep";
}

TEST(RestoreRules, Undecomposable) {
  EXPECT_TRUE(rules::ruleUndecomposable(Typed("text").ctx()));
  EXPECT_TRUE(rules::ruleUndecomposable(Typed("raw").ctx()));
  EXPECT_FALSE(rules::ruleUndecomposable(Typed("mas").ctx()));
}

TEST(RestoreRules, ToneBeforeConsonant) {
  EXPECT_TRUE(rules::ruleToneBeforeConsonant(Typed("test").ctx()));
  EXPECT_TRUE(rules::ruleToneBeforeConsonant(Typed("most").ctx()));
  // Marked nucleus: deliberate Vietnamese.
  EXPECT_FALSE(rules::ruleToneBeforeConsonant(Typed("muwowjt").ctx()));
  // Tone key last.
  EXPECT_FALSE(rules::ruleToneBeforeConsonant(Typed("conf").ctx()));
  // Tone key followed by a vowel.
  EXPECT_FALSE(rules::ruleToneBeforeConsonant(Typed("cura").ctx()));
}

TEST(RestoreRules, InvalidInitial) {
  EXPECT_TRUE(rules::ruleInvalidInitial(Typed("fas").ctx()));
  EXPECT_TRUE(rules::ruleInvalidInitial(Typed("wa").ctx()));
  EXPECT_FALSE(rules::ruleInvalidInitial(Typed("quas").ctx()));
  EXPECT_FALSE(rules::ruleInvalidInitial(Typed("ngoaij").ctx()));
  EXPECT_FALSE(rules::ruleInvalidInitial(Typed("air").ctx()));
}

TEST(RestoreRules, LiteralW) {
  EXPECT_TRUE(rules::ruleLiteralW(Typed("wh").ctx()));
  EXPECT_FALSE(rules::ruleLiteralW(Typed("law").ctx()));
  EXPECT_TRUE(rules::ruleLiteralW(Typed("aww").ctx()));
  EXPECT_FALSE(rules::ruleLiteralW(Typed("nuwowcs").ctx()));
}

TEST(RestoreRules, OrthographyTraps) {
  EXPECT_TRUE(rules::ruleOrthographyTrap(Typed("core").ctx()));
  EXPECT_TRUE(rules::ruleOrthographyTrap(Typed("pair").ctx()));
  EXPECT_FALSE(rules::ruleOrthographyTrap(Typed("air").ctx()));
  EXPECT_FALSE(rules::ruleOrthographyTrap(Typed("khore").ctx()));
  // Tone typed after the cluster is ordinary Vietnamese.
  EXPECT_FALSE(rules::ruleOrthographyTrap(Typed("khoer").ctx()));
  // ai + r after a common initial.
  EXPECT_FALSE(rules::ruleOrthographyTrap(Typed("hair").ctx()));
  EXPECT_FALSE(rules::ruleOrthographyTrap(Typed("mais").ctx()));

  EXPECT_TRUE(rules::isTrapAllowListed(U"air"));
  EXPECT_FALSE(rules::isTrapAllowListed(U"pair"));
}

TEST(RestoreRules, PipelineOrderAndNames) {
  EXPECT_EQ(firedRule("text"), "undecomposable");
  EXPECT_EQ(firedRule("test"), "tone_before_consonant");
  EXPECT_EQ(firedRule("core"), "orthography_trap");
  EXPECT_EQ(firedRule("pair"), "orthography_trap");
  EXPECT_EQ(firedRule("fix"), "undecomposable");
  EXPECT_EQ(firedRule("mas"), "keep");
  EXPECT_EQ(firedRule("air"), "keep");
  EXPECT_EQ(firedRule("these"), "keep");
  EXPECT_EQ(firedRule("mix"), "keep");
}

TEST(RestoreRules, InitialAndLetterWWordsFailDecomposition) {
  for (const char* keys : {"fas", "wa", "wh", "aww", "wow", "law"}) {
    const Typed t(keys);
    const RuleContext ctx = t.ctx();
    EXPECT_TRUE(rules::ruleUndecomposable(ctx)) << keys;
    EXPECT_EQ(firedRule(keys), "undecomposable") << keys;
  }
}

}  // namespace
}  // namespace tgtelex
