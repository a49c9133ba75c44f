/*
TGTelex — Per-word keystroke buffer and render state.
Copyright 2025-2026 Tamas Geczy.
Licensed under the MIT License. See LICENSE for details.
*/

#include "word_buffer.h"

namespace tgtelex {

WordBuffer::WordBuffer(ToneStyle style) : style_(style) {
  keys_.reserve(kMaxWordKeys);
}

void WordBuffer::setToneStyle(ToneStyle style) {
  if (style_ == style) return;
  style_ = style;
  if (!keys_.empty()) recompute();
}

void WordBuffer::setLiteral(bool literal) {
  if (keys_.empty()) literal_ = literal;
}

void WordBuffer::push(const KeyInfo& key) {
  if (full()) return;
  state_ = State::Collecting;
  if (keys_.size() < kMaxWordKeys) {
    keys_.push_back(key);
    recompute();
    return;
  }
  tail_.push_back(key.ch);
  rendered_.push_back(key.ch);
  syllable_ = Syllable();
  decomposed_ = false;
}

void WordBuffer::beginFinalize() {
  if (state_ == State::Collecting) state_ = State::Finalizing;
}

void WordBuffer::reset() {
  keys_.clear();
  tail_.clear();
  comp_ = Composition();
  rendered_.clear();
  syllable_ = Syllable();
  decomposed_ = false;
  literal_ = false;
  state_ = State::Empty;
}

std::u32string WordBuffer::raw() const {
  std::u32string out;
  out.reserve(keys_.size() + tail_.size());
  for (const KeyInfo& k : keys_) out.push_back(k.ch);
  out += tail_;
  return out;
}

void WordBuffer::recompute() {
  comp_ = compose(keys_, literal_);
  syllable_ = Syllable();
  rendered_ = renderComposition(comp_, style_, syllable_, decomposed_);
  if (!tail_.empty()) {
    rendered_ += tail_;
    syllable_ = Syllable();
    decomposed_ = false;
  }
}

} // namespace tgtelex
