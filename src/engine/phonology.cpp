/*
TGTelex — Vietnamese syllable phonology model.
Copyright 2025-2026 Tamas Geczy.
Licensed under the MIT License. See LICENSE for details.
*/

#include "phonology.h"

namespace tgtelex {

namespace {

using FR = FinalRule;
using IR = InitialRule;

// Vowel clusters. Columns: letters, final rule, initial rule,
// anchor (open, traditional), anchor (open, modern), anchor (closed).
const NucleusPattern kNuclei[] = {
  {U"a",   FR::Optional,  IR::Any, 0, 0, 0},
  {U"ă",   FR::Required,  IR::Any, 0, 0, 0},
  {U"â",   FR::Required,  IR::Any, 0, 0, 0},
  {U"e",   FR::Optional,  IR::Any, 0, 0, 0},
  {U"ê",   FR::Optional,  IR::Any, 0, 0, 0},
  {U"i",   FR::Optional,  IR::Any, 0, 0, 0},
  {U"o",   FR::Optional,  IR::Any, 0, 0, 0},
  {U"ô",   FR::Optional,  IR::Any, 0, 0, 0},
  {U"ơ",   FR::Optional,  IR::Any, 0, 0, 0},
  {U"u",   FR::Optional,  IR::Any, 0, 0, 0},
  {U"ư",   FR::Optional,  IR::Any, 0, 0, 0},
  {U"y",   FR::Optional,  IR::Any, 0, 0, 0},

  {U"ai",  FR::Forbidden, IR::Any, 0, 0, 0},
  {U"ao",  FR::Forbidden, IR::Any, 0, 0, 0},
  {U"au",  FR::Forbidden, IR::Any, 0, 0, 0},
  {U"ay",  FR::Forbidden, IR::Any, 0, 0, 0},
  {U"âu",  FR::Forbidden, IR::Any, 0, 0, 0},
  {U"ây",  FR::Forbidden, IR::Any, 0, 0, 0},
  {U"eo",  FR::Forbidden, IR::Any, 0, 0, 0},
  {U"êu",  FR::Forbidden, IR::Any, 0, 0, 0},
  {U"ia",  FR::Forbidden, IR::Any, 0, 0, 0},
  {U"iê",  FR::Required,  IR::RequiresInitial, 1, 1, 1},
  {U"iu",  FR::Forbidden, IR::Any, 0, 0, 0},
  {U"oa",  FR::Optional,  IR::Any, 0, 1, 1},
  {U"oă",  FR::Required,  IR::Any, 1, 1, 1},
  {U"oe",  FR::Optional,  IR::Any, 0, 1, 1},
  {U"oi",  FR::Forbidden, IR::Any, 0, 0, 0},
  {U"ôi",  FR::Forbidden, IR::Any, 0, 0, 0},
  {U"ơi",  FR::Forbidden, IR::Any, 0, 0, 0},
  {U"oo",  FR::Required,  IR::Any, 1, 1, 1},
  {U"ua",  FR::Forbidden, IR::Any, 0, 0, 0},
  {U"uâ",  FR::Required,  IR::Any, 1, 1, 1},
  {U"uê",  FR::Optional,  IR::Any, 1, 1, 1},
  {U"ui",  FR::Forbidden, IR::Any, 0, 0, 0},
  {U"uô",  FR::Required,  IR::Any, 1, 1, 1},
  {U"uơ",  FR::Forbidden, IR::Any, 1, 1, 1},
  {U"uy",  FR::Optional,  IR::Any, 0, 1, 1},
  {U"ưa",  FR::Forbidden, IR::Any, 0, 0, 0},
  {U"ưi",  FR::Forbidden, IR::Any, 0, 0, 0},
  {U"ươ",  FR::Required,  IR::Any, 1, 1, 1},
  {U"ưu",  FR::Forbidden, IR::Any, 0, 0, 0},
  {U"yê",  FR::Required,  IR::NoneOrQu, 1, 1, 1},

  {U"iêu", FR::Forbidden, IR::RequiresInitial, 1, 1, 1},
  {U"yêu", FR::Forbidden, IR::NoneOrQu, 1, 1, 1},
  {U"oai", FR::Forbidden, IR::Any, 1, 1, 1},
  {U"oao", FR::Forbidden, IR::Any, 1, 1, 1},
  {U"oay", FR::Forbidden, IR::Any, 1, 1, 1},
  {U"oeo", FR::Forbidden, IR::Any, 1, 1, 1},
  {U"uây", FR::Forbidden, IR::Any, 1, 1, 1},
  {U"uôi", FR::Forbidden, IR::Any, 1, 1, 1},
  {U"ươi", FR::Forbidden, IR::Any, 1, 1, 1},
  {U"ươu", FR::Forbidden, IR::Any, 1, 1, 1},
  {U"uya", FR::Forbidden, IR::Any, 1, 1, 1},
  {U"uyê", FR::Required,  IR::Any, 2, 2, 2},
  {U"uyu", FR::Forbidden, IR::Any, 1, 1, 1},
};

// Longest first, so ngh wins over ng wins over n.
const std::u32string_view kInitials[] = {
  U"ngh",
  U"ch", U"gh", U"gi", U"kh", U"ng", U"nh", U"ph", U"qu", U"th", U"tr",
  U"b", U"c", U"d", U"đ", U"g", U"h", U"k", U"l", U"m", U"n", U"p",
  U"r", U"s", U"t", U"v", U"x",
};

const std::u32string_view kFinals[] = {
  U"c", U"ch", U"m", U"n", U"ng", U"nh", U"p", U"t",
};

bool isFrontVowel(char32_t c) {
  return c == U'i' || c == U'e' || c == U'ê' || c == U'y';
}

bool isStopFinal(std::u32string_view f) {
  return f == U"c" || f == U"ch" || f == U"p" || f == U"t";
}

std::size_t leadingVowels(std::u32string_view s) {
  std::size_t n = 0;
  while (n < s.size() && isVowelLetter(s[n])) ++n;
  return n;
}

// Spelling constraints between the initial and the first nucleus letter.
bool initialFits(std::u32string_view initial, char32_t first) {
  if (initial == U"k" || initial == U"gh" || initial == U"ngh") {
    return isFrontVowel(first);
  }
  if (initial == U"c" || initial == U"ng") return !isFrontVowel(first);
  if (initial == U"g") return first != U'e' && first != U'ê' && first != U'y';
  if (initial == U"qu") return first != U'u' && first != U'ư' && first != U'o';
  return true;
}

bool patternFits(const NucleusPattern& p, std::u32string_view initial,
                 std::u32string_view final) {
  switch (p.finalRule) {
    case FinalRule::Forbidden:
      if (!final.empty()) return false;
      break;
    case FinalRule::Required:
      if (final.empty()) return false;
      break;
    case FinalRule::Optional:
      break;
  }
  switch (p.initialRule) {
    case InitialRule::RequiresInitial:
      return !initial.empty();
    case InitialRule::NoneOrQu:
      return initial.empty() || initial == U"qu";
    case InitialRule::Any:
      break;
  }
  return true;
}

bool finalFits(std::u32string_view nucleus, std::u32string_view final, Tone tone) {
  if (final.empty()) return true;
  if (final == U"ch" || final == U"nh") {
    const char32_t last = nucleus.back();
    if (last != U'a' && last != U'ê' && last != U'i' && last != U'y') return false;
  }
  if (nucleus == U"oo" && final != U"ng" && final != U"c") return false;
  if (isStopFinal(final)) {
    return tone == Tone::Level || tone == Tone::Acute || tone == Tone::Dot;
  }
  return true;
}

bool trySplit(std::u32string_view spelled, std::u32string_view initial, Tone tone,
              Syllable& out) {
  const std::u32string_view rest = spelled.substr(initial.size());
  const std::size_t n = leadingVowels(rest);
  // Also keeps gi / qu from acting as initials without a following vowel.
  if (n == 0) return false;

  const std::u32string_view nucleus = rest.substr(0, n);
  const std::u32string_view final = rest.substr(n);
  const NucleusPattern* pattern = findNucleus(nucleus);
  if (!pattern) return false;
  if (!final.empty() && !isValidFinal(final)) return false;
  if (!initialFits(initial, nucleus.front())) return false;
  if (!patternFits(*pattern, initial, final)) return false;
  if (!finalFits(nucleus, final, tone)) return false;

  out.initial.assign(initial);
  out.nucleus.assign(nucleus);
  out.final.assign(final);
  out.pattern = pattern;
  out.tone = tone;
  return true;
}

}  // namespace

bool isVowelLetter(char32_t c) {
  switch (c) {
    case U'a': case U'ă': case U'â': case U'e': case U'ê': case U'i':
    case U'o': case U'ô': case U'ơ': case U'u': case U'ư': case U'y':
      return true;
    default:
      return false;
  }
}

bool isMarkedVowel(char32_t c) {
  switch (c) {
    case U'ă': case U'â': case U'ê': case U'ô': case U'ơ': case U'ư':
      return true;
    default:
      return false;
  }
}

bool isValidInitial(std::u32string_view s) {
  if (s.empty()) return true;
  for (std::u32string_view i : kInitials) {
    if (i == s) return true;
  }
  return false;
}

bool isValidFinal(std::u32string_view s) {
  for (std::u32string_view f : kFinals) {
    if (f == s) return true;
  }
  return false;
}

const NucleusPattern* findNucleus(std::u32string_view letters) {
  for (const NucleusPattern& p : kNuclei) {
    if (p.letters == letters) return &p;
  }
  return nullptr;
}

int toneAnchor(const NucleusPattern& pattern, bool hasFinal, ToneStyle style) {
  if (hasFinal) return pattern.anchorClosed;
  return style == ToneStyle::Modern ? pattern.anchorOpenModern : pattern.anchorOpen;
}

int fallbackToneAnchor(std::u32string_view run, bool closed, ToneStyle style) {
  if (run.empty()) return 0;
  for (std::size_t i = run.size(); i-- > 0;) {
    if (isMarkedVowel(run[i])) return static_cast<int>(i);
  }
  if (const NucleusPattern* p = findNucleus(run)) return toneAnchor(*p, closed, style);
  if (run.size() >= 3) return 1;
  if (run.size() == 2 && closed) return 1;
  return 0;
}

bool decompose(std::u32string_view spelled, Tone tone, Syllable& out) {
  if (spelled.empty()) return false;
  for (std::u32string_view initial : kInitials) {
    if (spelled.substr(0, initial.size()) != initial) continue;
    if (trySplit(spelled, initial, tone, out)) return true;
  }
  return trySplit(spelled, std::u32string_view(), tone, out);
}

} // namespace tgtelex
