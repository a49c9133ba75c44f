/*
TGTelex — Vietnamese letter tables (marks, tones, case).
Copyright 2025-2026 Tamas Geczy.
Licensed under the MIT License. See LICENSE for details.
*/

#ifndef TGTELEX_ENGINE_VNCHARS_H
#define TGTELEX_ENGINE_VNCHARS_H

#include <string>
#include <string_view>

namespace tgtelex {

// Syllable tone. Numeric order matches the columns of the letter table.
enum class Tone : int {
  Level = 0,
  Acute = 1,    // sắc
  Grave = 2,    // huyền
  Hook = 3,     // hỏi
  Tilde = 4,    // ngã
  Dot = 5,      // nặng
};

// Per-letter diacritic shape. Stroke is the d -> đ rule.
enum class Mark : int {
  None = 0,
  Circumflex,
  Horn,
  Breve,
  Stroke,
};

// a e i o u y (plain ASCII lowercase).
bool isVowelBase(char32_t c);

// Lowercase base + mark -> lowercase letter without tone (a + Breve -> ă).
// Returns 0 if the mark cannot sit on that base.
char32_t markedLetter(char32_t base, Mark mark);

// Lowercase marked vowel (a ă â e ê i o ô ơ u ư y) with a tone, in the
// requested case. Returns 0 if the letter is not a Vietnamese vowel.
char32_t tonedVowel(char32_t markedLower, Tone tone, bool upper);

// Case mapping for ASCII and every precomposed Vietnamese letter. Other
// characters are returned unchanged.
char32_t toLowerVn(char32_t c);
char32_t toUpperVn(char32_t c);
bool isUpperVn(char32_t c);
bool isLetterVn(char32_t c);

std::u32string lowerVn(std::u32string_view s);
std::u32string upperVn(std::u32string_view s);

} // namespace tgtelex

#endif
