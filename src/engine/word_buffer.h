/*
TGTelex — Per-word keystroke buffer and render state.
Copyright 2025-2026 Tamas Geczy.
Licensed under the MIT License. See LICENSE for details.
*/

#ifndef TGTELEX_ENGINE_WORD_BUFFER_H
#define TGTELEX_ENGINE_WORD_BUFFER_H

#include <string>
#include <vector>

#include "composer.h"
#include "key_class.h"
#include "phonology.h"

namespace tgtelex {

// Keys typed past kMaxWordKeys are kept as an uncomposed tail of at most
// this many keys.
constexpr std::size_t kMaxTailKeys = 224;

// Raw keystrokes of the word being typed. The rendered text is recomputed
// from all keys on every push, so a tone re-anchors as the nucleus grows.
class WordBuffer {
public:
  enum class State {
    Empty,
    Collecting,
    Finalizing,
  };

  explicit WordBuffer(ToneStyle style = ToneStyle::Traditional);

  void setToneStyle(ToneStyle style);
  ToneStyle toneStyle() const { return style_; }

  // Only takes effect on an empty buffer: the next word is kept as typed.
  void setLiteral(bool literal);
  bool literal() const { return literal_; }

  // Past kMaxWordKeys the key is appended to the tail as typed, without
  // recomposing. Ignored once full().
  void push(const KeyInfo& key);
  void beginFinalize();
  void reset();

  State state() const { return state_; }
  bool empty() const { return keys_.empty(); }
  bool overflowed() const { return !tail_.empty(); }
  bool full() const { return tail_.size() >= kMaxTailKeys; }

  // Composed keys only, at most kMaxWordKeys.
  const std::vector<KeyInfo>& keys() const { return keys_; }
  const Composition& composition() const { return comp_; }
  const std::u32string& rendered() const { return rendered_; }
  std::u32string raw() const;

  bool decomposed() const { return decomposed_; }
  const Syllable& syllable() const { return syllable_; }

private:
  void recompute();

  ToneStyle style_;
  State state_ = State::Empty;
  bool literal_ = false;
  std::vector<KeyInfo> keys_;
  std::u32string tail_;
  Composition comp_;
  std::u32string rendered_;
  Syllable syllable_;
  bool decomposed_ = false;
};

} // namespace tgtelex

#endif
