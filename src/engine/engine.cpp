/*
TGTelex — Telex engine: keys in, edit instructions out.
Copyright 2025-2026 Tamas Geczy.
Licensed under the MIT License. See LICENSE for details.
*/

#include "engine.h"

#include <utility>

#include "debug_log.h"
#include "rules/rule_pipeline.h"
#include "utf8.h"

namespace tgtelex {

static bool isPrintable(char32_t ch) {
  return ch >= 0x20 && ch != 0x7F;
}

static EditInstruction passThrough() {
  EditInstruction e;
  e.passKey = true;
  return e;
}

EditInstruction diffEdit(const std::u32string& before, const std::u32string& after) {
  std::size_t common = 0;
  while (common < before.size() && common < after.size() && before[common] == after[common]) {
    ++common;
  }
  EditInstruction e;
  e.action = EditAction::Send;
  e.backspace = before.size() - common;
  e.text = after.substr(common);
  return e;
}

Engine::Engine(std::shared_ptr<const CorrectionTables> tables)
    : buffer_(settings_.toneStyle), autocorrect_(std::move(tables)) {
  autocorrect_.setMode(settings_.autocorrect);
}

void Engine::applySettings(const EngineSettings& settings) {
  settings_ = settings;
  buffer_.setToneStyle(settings_.toneStyle);
  autocorrect_.setMode(settings_.autocorrect);
  DebugLog::SetEnabled(settings_.debugLog);
  if (!settings_.enabled) {
    buffer_.reset();
    rawPending_ = false;
  }
}

void Engine::setEnabled(bool enabled) {
  settings_.enabled = enabled;
  if (!enabled) {
    buffer_.reset();
    rawPending_ = false;
  }
}

void Engine::setToneStyle(ToneStyle style) {
  settings_.toneStyle = style;
  buffer_.setToneStyle(style);
}

void Engine::setAutocorrectMode(AutoCorrectMode mode) {
  settings_.autocorrect = mode;
  autocorrect_.setMode(mode);
}

EditInstruction Engine::onKey(char32_t ch, bool boundaryHint) {
  if (!settings_.enabled) return passThrough();

  KeyInfo key = classifyKey(ch);
  if (boundaryHint) key.cls = KeyClass::Break;

  switch (key.cls) {
    case KeyClass::Cancel:
      if (buffer_.empty()) {
        rawPending_ = false;
        return passThrough();
      }
      return cancel();
    case KeyClass::Backspace:
      buffer_.reset();
      rawPending_ = false;
      return passThrough();
    case KeyClass::RawPrefix:
      return rawPrefix(key);
    case KeyClass::Break:
      return finishWord(ch);
    default:
      break;
  }

  // A run this long is not a word. Leave it on screen as shown and keep
  // the rest of the run literal.
  if (buffer_.full()) {
    TGTELEX_LOG("word buffer full, committing %zu keys", buffer_.raw().size());
    buffer_.reset();
    buffer_.setLiteral(true);
  }
  if (buffer_.empty()) {
    buffer_.setLiteral(buffer_.literal() || rawPending_);
    rawPending_ = false;
  }
  if (buffer_.keys().size() >= kMaxWordKeys) {
    buffer_.push(key);
    EditInstruction e;
    e.action = EditAction::Send;
    e.text.push_back(ch);
    return e;
  }
  const std::u32string before = buffer_.rendered();
  buffer_.push(key);
  return diffEdit(before, buffer_.rendered());
}

EditInstruction Engine::rawPrefix(const KeyInfo& key) {
  if (!settings_.rawPrefix || !buffer_.empty()) return finishWord(key.ch);

  EditInstruction e;
  e.action = EditAction::Send;
  if (rawPending_) {
    e.text.push_back(key.ch);
    rawPending_ = false;
  } else {
    rawPending_ = true;
  }
  return e;
}

EditInstruction Engine::cancel() {
  if (buffer_.empty()) {
    rawPending_ = false;
    return EditInstruction();
  }
  EditInstruction e;
  e.action = EditAction::Restore;
  e.backspace = buffer_.rendered().size();
  e.text = buffer_.raw();
  buffer_.reset();
  return e;
}

EditInstruction Engine::finishWord(char32_t ch) {
  const bool printable = isPrintable(ch);
  if (buffer_.empty()) {
    rawPending_ = false;
    if (!printable) return passThrough();
    EditInstruction e;
    e.action = EditAction::Send;
    e.text.push_back(ch);
    return e;
  }

  buffer_.beginFinalize();
  const std::u32string shown = buffer_.rendered();
  std::u32string word = shown;
  EditAction action = EditAction::Send;

  if (!buffer_.literal()) {
    if (settings_.autoRestore) {
      const RuleContext ctx(buffer_.keys(), buffer_.composition(), shown,
                            buffer_.decomposed(), buffer_.syllable());
      const Decision d = classifyWord(ctx);
      if (d.verdict == Verdict::Restore) {
        word = buffer_.raw();
        action = EditAction::Restore;
        TGTELEX_LOG("restore '%s' -> '%s' (%s)", u32ToUtf8(shown).c_str(),
                    u32ToUtf8(word).c_str(), d.rule);
      }
    }

    CorrectionResult corr;
    if (autocorrect_.tryCorrect(u32ToUtf8(word), corr)) {
      TGTELEX_LOG("autocorrect '%s' -> '%s'", corr.original.c_str(), corr.corrected.c_str());
      word = utf8ToU32(corr.corrected);
    }
  }
  buffer_.reset();

  EditInstruction e;
  if (action == EditAction::Restore) {
    e.action = action;
    e.backspace = shown.size();
    e.text = word;
  } else {
    e = diffEdit(shown, word);
  }
  if (printable) {
    e.text.push_back(ch);
  } else {
    e.passKey = true;
  }
  return e;
}

} // namespace tgtelex
