/*
TGTelex — Telex key classification.
Copyright 2025-2026 Tamas Geczy.
Licensed under the MIT License. See LICENSE for details.
*/

#ifndef TGTELEX_ENGINE_KEY_CLASS_H
#define TGTELEX_ENGINE_KEY_CLASS_H

#include "vnchars.h"

namespace tgtelex {

enum class KeyClass {
  Vowel,      // a e i o u y
  Consonant,
  Tone,       // s f r x j
  ToneClear,  // z
  Mark,       // w
  Stroke,     // d
  Break,
  Cancel,
  RawPrefix,
  Backspace,
};

constexpr char32_t kKeyEscape = 0x1B;
constexpr char32_t kKeyBackspace = 0x08;
constexpr char32_t kKeyRawPrefix = U'\\';

struct KeyInfo {
  KeyClass cls = KeyClass::Break;
  char32_t ch = 0;       // as typed
  char32_t lower = 0;    // case-normalized ASCII letter, or ch for non-letters
  bool upper = false;
  Tone tone = Tone::Level;  // only meaningful for KeyClass::Tone

  bool isLetter() const {
    return cls != KeyClass::Break && cls != KeyClass::Cancel &&
           cls != KeyClass::RawPrefix && cls != KeyClass::Backspace;
  }
};

// Stateless; anything that is not an ASCII letter or one of the control
// keys is a Break.
KeyInfo classifyKey(char32_t ch);

} // namespace tgtelex

#endif
