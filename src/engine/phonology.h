/*
TGTelex — Vietnamese syllable phonology model.
Copyright 2025-2026 Tamas Geczy.
Licensed under the MIT License. See LICENSE for details.
*/

#ifndef TGTELEX_ENGINE_PHONOLOGY_H
#define TGTELEX_ENGINE_PHONOLOGY_H

#include <cstdint>
#include <string>
#include <string_view>

#include "vnchars.h"

namespace tgtelex {

// Where the tone goes on open oa / oe / uy: hòa (traditional) or hoà (modern).
enum class ToneStyle {
  Traditional,
  Modern,
};

enum class FinalRule : std::uint8_t {
  Forbidden,  // glide-ending clusters (ai, ươi, ...) never take a consonant final
  Optional,
  Required,   // ă, â, iê, uô, ươ, ... only occur in closed syllables
};

enum class InitialRule : std::uint8_t {
  Any,
  RequiresInitial,  // iê, iêu
  NoneOrQu,         // yê, yêu
};

// One enumerated vowel cluster. Letters are lowercase, marked, toneless.
struct NucleusPattern {
  std::u32string_view letters;
  FinalRule finalRule = FinalRule::Optional;
  InitialRule initialRule = InitialRule::Any;
  // Tone anchor index within the cluster.
  int anchorOpen = 0;
  int anchorOpenModern = 0;
  int anchorClosed = 0;
};

// Result of a successful decomposition. All parts are lowercase, toneless.
struct Syllable {
  std::u32string initial;
  std::u32string nucleus;
  std::u32string final;
  const NucleusPattern* pattern = nullptr;
  Tone tone = Tone::Level;

  bool hasFinal() const { return !final.empty(); }
  // Index of the nucleus' first letter within the whole syllable.
  std::size_t nucleusStart() const { return initial.size(); }
};

// a ă â e ê i o ô ơ u ư y (lowercase, toneless).
bool isVowelLetter(char32_t c);

// Vowel carrying a Telex mark (ă â ê ô ơ ư).
bool isMarkedVowel(char32_t c);

bool isValidInitial(std::u32string_view s);
bool isValidFinal(std::u32string_view s);

// Exact lookup in the vowel-cluster table; nullptr if not a valid nucleus.
const NucleusPattern* findNucleus(std::u32string_view letters);

// Anchor index within the nucleus for the given pattern.
int toneAnchor(const NucleusPattern& pattern, bool hasFinal, ToneStyle style);

// Anchor for a vowel run that is not (yet) a valid nucleus, used while a
// word is still being typed: last marked vowel, else the table anchor if
// the run is a known cluster, else middle of three, else second of two when
// closed, else first.
int fallbackToneAnchor(std::u32string_view run, bool closed, ToneStyle style);

// Split spelled (lowercase, marked, toneless) text into initial + nucleus +
// final. Returns false when no split satisfies every constraint.
bool decompose(std::u32string_view spelled, Tone tone, Syllable& out);

} // namespace tgtelex

#endif
