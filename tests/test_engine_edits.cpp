/*
TGTelex — Engine edit instruction and key handling tests.
Copyright 2025-2026 Tamas Geczy.
Licensed under the MIT License. See LICENSE for details.
*/

#include <gtest/gtest.h>

#include "engine/engine.h"
#include "telex_harness.h"

namespace tgtelex {
namespace {

class EngineEdits : public ::testing::Test {
protected:
  EngineEdits() : engine(testing::tables()) {}

  void feed(const char32_t* keys) {
    for (const char32_t* p = keys; *p; ++p) engine.onKey(*p);
  }

  Engine engine;
};

TEST(DiffEdit, KeepsCommonPrefix) {
  EditInstruction e = diffEdit(U"hòa", U"hoàn");
  EXPECT_EQ(e.action, EditAction::Send);
  EXPECT_EQ(e.backspace, 2u);
  EXPECT_EQ(e.text, U"oàn");

  e = diffEdit(U"tiê", U"tiên");
  EXPECT_EQ(e.backspace, 0u);
  EXPECT_EQ(e.text, U"n");

  e = diffEdit(U"", U"a");
  EXPECT_EQ(e.backspace, 0u);
  EXPECT_EQ(e.text, U"a");

  e = diffEdit(U"as", U"as");
  EXPECT_EQ(e.backspace, 0u);
  EXPECT_TRUE(e.text.empty());
}

TEST_F(EngineEdits, LetterKeys) {
  EditInstruction e = engine.onKey(U'm');
  EXPECT_EQ(e.action, EditAction::Send);
  EXPECT_EQ(e.backspace, 0u);
  EXPECT_EQ(e.text, U"m");
  EXPECT_FALSE(e.passKey);

  engine.onKey(U'a');
  e = engine.onKey(U's');
  EXPECT_EQ(e.backspace, 1u);
  EXPECT_EQ(e.text, U"á");
}

TEST_F(EngineEdits, ToneMovesWhenNucleusGrows) {
  feed(U"hoaf");
  EXPECT_EQ(engine.buffer().rendered(), U"hòa");
  const EditInstruction e = engine.onKey(U'n');
  EXPECT_EQ(e.backspace, 2u);
  EXPECT_EQ(e.text, U"oàn");
}

TEST_F(EngineEdits, RestoreReplacesWholeWord) {
  feed(U"text");
  EXPECT_EQ(engine.buffer().rendered(), U"tẽt");
  const EditInstruction e = engine.onKey(U' ');
  EXPECT_EQ(e.action, EditAction::Restore);
  EXPECT_EQ(e.backspace, 3u);
  EXPECT_EQ(e.text, U"text ");
  EXPECT_FALSE(e.passKey);
  EXPECT_TRUE(engine.buffer().empty());
}

TEST_F(EngineEdits, KeptWordOnlyAppendsBreak) {
  feed(U"mas");
  const EditInstruction e = engine.onKey(U',');
  EXPECT_EQ(e.action, EditAction::Send);
  EXPECT_EQ(e.backspace, 0u);
  EXPECT_EQ(e.text, U",");
}

TEST_F(EngineEdits, NonPrintableBreakPassesKey) {
  feed(U"mas");
  const EditInstruction e = engine.onKey(U'\n');
  EXPECT_TRUE(e.passKey);
  EXPECT_TRUE(e.text.empty());
  EXPECT_EQ(testing::type("mas\n"), "má\n");
  EXPECT_EQ(testing::type("text\t"), "text\t");
}

TEST_F(EngineEdits, BreakOnEmptyBuffer) {
  EditInstruction e = engine.onKey(U' ');
  EXPECT_EQ(e.action, EditAction::Send);
  EXPECT_EQ(e.text, U" ");

  e = engine.onKey(U'\r');
  EXPECT_TRUE(e.passKey);
}

TEST_F(EngineEdits, BoundaryHintEndsWord) {
  feed(U"text");
  const EditInstruction e = engine.onKey(0, true);
  EXPECT_EQ(e.action, EditAction::Restore);
  EXPECT_EQ(e.text, U"text");
  EXPECT_TRUE(e.passKey);
  EXPECT_TRUE(engine.buffer().empty());
}

TEST_F(EngineEdits, CancelRestoresRawKeys) {
  feed(U"dduowcj");
  const EditInstruction e = engine.onKey(0x1B);
  EXPECT_EQ(e.action, EditAction::Restore);
  EXPECT_EQ(e.backspace, 4u);
  EXPECT_EQ(e.text, U"dduowcj");
  EXPECT_FALSE(e.passKey);
  EXPECT_TRUE(engine.buffer().empty());

  EXPECT_EQ(testing::type("mas\x1b "), "mas ");
}

TEST_F(EngineEdits, CancelOnEmptyBuffer) {
  EXPECT_TRUE(engine.onKey(0x1B).passKey);
  const EditInstruction e = engine.cancel();
  EXPECT_EQ(e.action, EditAction::None);
  EXPECT_FALSE(e.passKey);
}

TEST_F(EngineEdits, BackspaceResetsWord) {
  feed(U"viet");
  const EditInstruction e = engine.onKey(0x08);
  EXPECT_TRUE(e.passKey);
  EXPECT_EQ(e.backspace, 0u);
  EXPECT_TRUE(engine.buffer().empty());
}

TEST_F(EngineEdits, RawPrefix) {
  const EditInstruction e = engine.onKey(U'\\');
  EXPECT_EQ(e.action, EditAction::Send);
  EXPECT_TRUE(e.text.empty());
  EXPECT_FALSE(e.passKey);

  EXPECT_EQ(testing::type("\\mix "), "mix ");
  EXPECT_EQ(testing::type("\\Vieetj as"), "Vieetj á");
  EXPECT_EQ(testing::type("\\\\"), "\\");
  EXPECT_EQ(testing::type("\\ as"), " á");
  // Inside a word the backslash is an ordinary break.
  EXPECT_EQ(testing::type("mas\\"), "má\\");
}

TEST_F(EngineEdits, RawPrefixDisabled) {
  EngineSettings s;
  s.rawPrefix = false;
  engine.applySettings(s);
  EXPECT_EQ(testing::typeInto(engine, "\\mas "), "\\má ");
}

TEST_F(EngineEdits, DisabledPassesEverything) {
  engine.setEnabled(false);
  const EditInstruction e = engine.onKey(U'a');
  EXPECT_TRUE(e.passKey);
  EXPECT_EQ(e.action, EditAction::None);
  EXPECT_EQ(testing::typeInto(engine, "mas "), "mas ");

  engine.setEnabled(true);
  EXPECT_EQ(testing::typeInto(engine, "mas "), "má ");
}

TEST_F(EngineEdits, DisablingDropsPendingWord) {
  feed(U"ma");
  engine.setEnabled(false);
  EXPECT_TRUE(engine.buffer().empty());
}

TEST_F(EngineEdits, AutoRestoreOff) {
  engine.setAutoRestore(false);
  EXPECT_EQ(testing::typeInto(engine, "text "), "tẽt ");
  EXPECT_EQ(testing::typeInto(engine, "core "), "cỏe ");
}

TEST_F(EngineEdits, ModernToneStyle) {
  engine.setToneStyle(ToneStyle::Modern);
  EXPECT_EQ(testing::typeInto(engine, "hoaf thuyr "), "hoà thuỷ ");
  engine.setToneStyle(ToneStyle::Traditional);
  EXPECT_EQ(testing::typeInto(engine, "hoaf thuyr "), "hòa thủy ");
}

TEST_F(EngineEdits, AutocorrectAfterRestore) {
  engine.setAutocorrectMode(AutoCorrectMode::English);
  EXPECT_EQ(testing::typeInto(engine, "teh "), "the ");
  EXPECT_EQ(testing::typeInto(engine, "Teh "), "The ");

  engine.setAutocorrectMode(AutoCorrectMode::Vietnamese);
  EXPECT_EQ(testing::typeInto(engine, "ko dc "), "không được ");
  EXPECT_EQ(testing::typeInto(engine, "teh "), "teh ");
}

TEST_F(EngineEdits, AutocorrectOnKeptWord) {
  engine.setAutocorrectMode(AutoCorrectMode::Vietnamese);
  feed(U"naf");
  const EditInstruction e = engine.onKey(U' ');
  EXPECT_EQ(e.action, EditAction::Send);
  EXPECT_EQ(e.backspace, 2u);
  EXPECT_EQ(e.text, U"là ");
}

TEST_F(EngineEdits, LiteralWordSkipsAutocorrect) {
  engine.setAutocorrectMode(AutoCorrectMode::English);
  EXPECT_EQ(testing::typeInto(engine, "\\teh "), "teh ");
}

TEST_F(EngineEdits, ApplySettings) {
  EngineSettings s;
  s.autocorrect = AutoCorrectMode::All;
  s.toneStyle = ToneStyle::Modern;
  s.autoRestore = false;
  engine.applySettings(s);
  EXPECT_EQ(engine.autocorrectMode(), AutoCorrectMode::All);
  EXPECT_EQ(engine.settings().toneStyle, ToneStyle::Modern);
  EXPECT_EQ(engine.correctionsCount(),
            kVietnameseCorrectionCount + kEnglishCorrectionCount);
  EXPECT_EQ(testing::typeInto(engine, "hoaf text "), "hoà tẽt ");

  CorrectionResult r;
  EXPECT_TRUE(engine.tryCorrect("recieve", r));
  EXPECT_EQ(r.corrected, "receive");
}

TEST_F(EngineEdits, LongWordOverflowsAsTyped) {
  const std::string keys(40, 'b');
  EXPECT_EQ(testing::typeInto(engine, keys + "as "), keys + "as ");
}

TEST_F(EngineEdits, OverflowKeysAreAppendedOnly) {
  feed(std::u32string(kMaxWordKeys, U'b').c_str());
  const EditInstruction e = engine.onKey(U'a');
  EXPECT_EQ(e.action, EditAction::Send);
  EXPECT_EQ(e.backspace, 0u);
  EXPECT_EQ(e.text, U"a");
  EXPECT_TRUE(engine.buffer().overflowed());
}

TEST_F(EngineEdits, EndlessRunStaysBounded) {
  std::string keys;
  for (int i = 0; i < 20000; ++i) {
    const EditInstruction e = engine.onKey(U'b');
    ASSERT_LE(engine.buffer().keys().size(), kMaxWordKeys);
    ASSERT_LE(engine.buffer().raw().size(), kMaxWordKeys + kMaxTailKeys);
    ASSERT_EQ(e.backspace, 0u);
    ASSERT_EQ(e.text, U"b");
  }
  // The rest of an overlong run is never transformed.
  EXPECT_TRUE(engine.buffer().literal());
  feed(U"as");
  EXPECT_EQ(engine.onKey(U' ').text, U" ");
}

}  // namespace
}  // namespace tgtelex
