/*
TGTelex — Key classification tests.
Copyright 2025-2026 Tamas Geczy.
Licensed under the MIT License. See LICENSE for details.
*/

#include <gtest/gtest.h>

#include "engine/key_class.h"

namespace tgtelex {
namespace {

TEST(KeyClass, Letters) {
  for (char32_t c : std::u32string(U"aeiouy")) {
    EXPECT_EQ(classifyKey(c).cls, KeyClass::Vowel);
  }
  for (char32_t c : std::u32string(U"bcghklmnpqtv")) {
    EXPECT_EQ(classifyKey(c).cls, KeyClass::Consonant);
  }
  EXPECT_EQ(classifyKey(U'w').cls, KeyClass::Mark);
  EXPECT_EQ(classifyKey(U'd').cls, KeyClass::Stroke);
  EXPECT_EQ(classifyKey(U'z').cls, KeyClass::ToneClear);
}

TEST(KeyClass, ToneKeysCarryTheirTone) {
  EXPECT_EQ(classifyKey(U's').tone, Tone::Acute);
  EXPECT_EQ(classifyKey(U'f').tone, Tone::Grave);
  EXPECT_EQ(classifyKey(U'r').tone, Tone::Hook);
  EXPECT_EQ(classifyKey(U'x').tone, Tone::Tilde);
  EXPECT_EQ(classifyKey(U'j').tone, Tone::Dot);
  EXPECT_EQ(classifyKey(U'J').cls, KeyClass::Tone);
}

TEST(KeyClass, CaseIsNormalized) {
  const KeyInfo k = classifyKey(U'A');
  EXPECT_EQ(k.cls, KeyClass::Vowel);
  EXPECT_EQ(k.lower, U'a');
  EXPECT_TRUE(k.upper);
  EXPECT_EQ(k.ch, U'A');
  EXPECT_FALSE(classifyKey(U'a').upper);
}

TEST(KeyClass, ControlKeysAndBreaks) {
  EXPECT_EQ(classifyKey(0x1B).cls, KeyClass::Cancel);
  EXPECT_EQ(classifyKey(0x08).cls, KeyClass::Backspace);
  EXPECT_EQ(classifyKey(U'\\').cls, KeyClass::RawPrefix);
  for (char32_t c : std::u32string(U" .,;!?1\n\t-")) {
    EXPECT_EQ(classifyKey(c).cls, KeyClass::Break);
    EXPECT_FALSE(classifyKey(c).isLetter());
  }
  EXPECT_EQ(classifyKey(U'ă').cls, KeyClass::Break);
}

}  // namespace
}  // namespace tgtelex
