/*
TGTelex — Telex composition: keystrokes -> marked letters + tone.
Copyright 2025-2026 Tamas Geczy.
Licensed under the MIT License. See LICENSE for details.
*/

#ifndef TGTELEX_ENGINE_COMPOSER_H
#define TGTELEX_ENGINE_COMPOSER_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "key_class.h"
#include "phonology.h"
#include "vnchars.h"

namespace tgtelex {

// Keys past this many in one word are not composed; see WordBuffer.
constexpr std::size_t kMaxWordKeys = 32;

// What the composer did with one raw key.
enum class KeyUse : std::uint8_t {
  Letter,      // appended as its own letter
  Literal,     // a modifier key that had nothing to modify
  Tone,        // set or replaced the syllable tone
  ToneClear,   // z removed the tone
  Mark,        // w added horn / breve
  Circumflex,  // repeated a / e / o
  Stroke,      // dd
  Undo,        // removed its own modifier and was appended as a letter
};

struct ComposedLetter {
  char32_t base = 0;  // lowercase ASCII
  Mark mark = Mark::None;
  bool upper = false;
  int key = -1;       // raw key index that produced the letter

  // Lowercase letter with its mark, no tone (ư, đ, ...).
  char32_t spelled() const;
  bool isVowel() const;
};

struct Composition {
  std::vector<ComposedLetter> letters;
  std::vector<KeyUse> uses;  // parallel to the raw keys
  Tone tone = Tone::Level;
  int toneKey = -1;

  // Set once a modifier kind was undone; its keys are literal from then on.
  bool toneLocked = false;
  bool markLocked = false;
  bool circumflexLocked = false;
  bool strokeLocked = false;

  std::u32string spelled() const;
  bool hasVowel() const;
  bool hasMarkedVowel() const;
};

// Half-open range of letter indices.
struct VowelRun {
  std::size_t begin = 0;
  std::size_t end = 0;

  bool empty() const { return begin == end; }
  std::size_t size() const { return end - begin; }
};

// The last run of vowel letters. The u of qu and the i of gi are not part
// of the run when another vowel follows them.
VowelRun lastVowelRun(const std::vector<ComposedLetter>& letters);

// Replays every key from scratch. In literal mode nothing is transformed.
// An open ươ that only decomposes as uơ is spelled uơ.
Composition compose(const std::vector<KeyInfo>& keys, bool literal);

// Places the tone and produces the display text. outDecomposed tells whether
// the letters form a valid syllable (outSyllable is filled only then).
std::u32string renderComposition(const Composition& comp, ToneStyle style,
                                 Syllable& outSyllable, bool& outDecomposed);

} // namespace tgtelex

#endif
