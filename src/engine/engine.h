/*
TGTelex — Telex engine: keys in, edit instructions out.
Copyright 2025-2026 Tamas Geczy.
Licensed under the MIT License. See LICENSE for details.
*/

#ifndef TGTELEX_ENGINE_ENGINE_H
#define TGTELEX_ENGINE_ENGINE_H

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>

#include "autocorrect.h"
#include "settings.h"
#include "word_buffer.h"

namespace tgtelex {

enum class EditAction : int {
  None = 0,     // nothing to change on screen
  Send = 1,     // replace the tail of the current word
  Restore = 2,  // replace the whole rendered word with its raw keys
};

// Delete `backspace` code points before the caret, then insert `text`.
// passKey tells the host to deliver the original key itself afterwards.
struct EditInstruction {
  EditAction action = EditAction::None;
  std::size_t backspace = 0;
  std::u32string text;
  bool passKey = false;
};

// One per input context. Not thread-safe; calls must be serialized.
class Engine {
public:
  explicit Engine(std::shared_ptr<const CorrectionTables> tables);

  // boundaryHint forces the key to end the current word.
  EditInstruction onKey(char32_t ch, bool boundaryHint = false);

  // Put the raw keystrokes of the current word back and forget it.
  EditInstruction cancel();

  void applySettings(const EngineSettings& settings);
  const EngineSettings& settings() const { return settings_; }

  void setEnabled(bool enabled);
  void setAutoRestore(bool on) { settings_.autoRestore = on; }
  void setToneStyle(ToneStyle style);
  void setAutocorrectMode(AutoCorrectMode mode);
  AutoCorrectMode autocorrectMode() const { return autocorrect_.mode(); }

  bool tryCorrect(std::string_view word, CorrectionResult& out) const {
    return autocorrect_.tryCorrect(word, out);
  }
  std::size_t correctionsCount() const { return autocorrect_.correctionsCount(); }

  const WordBuffer& buffer() const { return buffer_; }

private:
  EditInstruction finishWord(char32_t ch);
  EditInstruction rawPrefix(const KeyInfo& key);

  EngineSettings settings_;
  WordBuffer buffer_;
  AutoCorrect autocorrect_;
  bool rawPending_ = false;
};

// Minimal edit turning `before` into `after`: keep the common prefix.
EditInstruction diffEdit(const std::u32string& before, const std::u32string& after);

} // namespace tgtelex

#endif
