/*
TGTelex — Telex key classification.
Copyright 2025-2026 Tamas Geczy.
Licensed under the MIT License. See LICENSE for details.
*/

#include "key_class.h"

namespace tgtelex {

static bool telexTone(char32_t lower, Tone& out) {
  switch (lower) {
    case U's': out = Tone::Acute; return true;
    case U'f': out = Tone::Grave; return true;
    case U'r': out = Tone::Hook; return true;
    case U'x': out = Tone::Tilde; return true;
    case U'j': out = Tone::Dot; return true;
    default: return false;
  }
}

KeyInfo classifyKey(char32_t ch) {
  KeyInfo k;
  k.ch = ch;
  k.lower = ch;

  switch (ch) {
    case kKeyEscape:
      k.cls = KeyClass::Cancel;
      return k;
    case kKeyBackspace:
      k.cls = KeyClass::Backspace;
      return k;
    case kKeyRawPrefix:
      k.cls = KeyClass::RawPrefix;
      return k;
    default:
      break;
  }

  if (ch >= U'A' && ch <= U'Z') {
    k.upper = true;
    k.lower = ch + 32;
  } else if (!(ch >= U'a' && ch <= U'z')) {
    k.cls = KeyClass::Break;
    return k;
  }

  if (isVowelBase(k.lower)) {
    k.cls = KeyClass::Vowel;
  } else if (telexTone(k.lower, k.tone)) {
    k.cls = KeyClass::Tone;
  } else if (k.lower == U'z') {
    k.cls = KeyClass::ToneClear;
  } else if (k.lower == U'w') {
    k.cls = KeyClass::Mark;
  } else if (k.lower == U'd') {
    k.cls = KeyClass::Stroke;
  } else {
    k.cls = KeyClass::Consonant;
  }
  return k;
}

} // namespace tgtelex
