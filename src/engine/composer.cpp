/*
TGTelex — Telex composition: keystrokes -> marked letters + tone.
Copyright 2025-2026 Tamas Geczy.
Licensed under the MIT License. See LICENSE for details.
*/

#include "composer.h"

namespace tgtelex {

char32_t ComposedLetter::spelled() const {
  const char32_t c = markedLetter(base, mark);
  return c ? c : base;
}

bool ComposedLetter::isVowel() const {
  return isVowelLetter(spelled());
}

std::u32string Composition::spelled() const {
  std::u32string out;
  out.reserve(letters.size());
  for (const ComposedLetter& l : letters) out.push_back(l.spelled());
  return out;
}

bool Composition::hasVowel() const {
  for (const ComposedLetter& l : letters) {
    if (l.isVowel()) return true;
  }
  return false;
}

bool Composition::hasMarkedVowel() const {
  for (const ComposedLetter& l : letters) {
    if (l.isVowel() && l.mark != Mark::None) return true;
  }
  return false;
}

VowelRun lastVowelRun(const std::vector<ComposedLetter>& letters) {
  VowelRun run;
  std::size_t i = letters.size();
  while (i > 0 && !letters[i - 1].isVowel()) --i;
  if (i == 0) return run;

  run.end = i;
  run.begin = i - 1;
  while (run.begin > 0 && letters[run.begin - 1].isVowel()) --run.begin;

  if (run.size() > 1 && run.begin > 0) {
    const char32_t prev = letters[run.begin - 1].spelled();
    const char32_t first = letters[run.begin].spelled();
    if ((prev == U'q' && first == U'u') || (prev == U'g' && first == U'i')) {
      ++run.begin;
    }
  }
  return run;
}

namespace {

struct Composer {
  Composition& c;

  void append(const KeyInfo& k, int idx, KeyUse use) {
    ComposedLetter l;
    l.base = k.lower;
    l.upper = k.upper;
    l.key = idx;
    c.letters.push_back(l);
    c.uses.push_back(use);
  }

  void tone(const KeyInfo& k, int idx) {
    if (c.toneLocked || !c.hasVowel()) {
      append(k, idx, KeyUse::Literal);
      return;
    }
    if (c.tone == k.tone) {
      c.tone = Tone::Level;
      c.toneKey = -1;
      c.toneLocked = true;
      append(k, idx, KeyUse::Undo);
      return;
    }
    c.tone = k.tone;
    c.toneKey = idx;
    c.uses.push_back(KeyUse::Tone);
  }

  void toneClear(const KeyInfo& k, int idx) {
    if (c.toneLocked || c.tone == Tone::Level) {
      append(k, idx, KeyUse::Literal);
      return;
    }
    c.tone = Tone::Level;
    c.toneKey = -1;
    c.uses.push_back(KeyUse::ToneClear);
  }

  // w: uo / ưo -> ươ, oa -> oă, else the first u / o / a of the last run.
  void mark(const KeyInfo& k, int idx) {
    if (c.markLocked) {
      append(k, idx, KeyUse::Literal);
      return;
    }
    const VowelRun run = lastVowelRun(c.letters);

    std::size_t targets[2];
    Mark marks[2];
    std::size_t count = 0;
    for (std::size_t i = run.begin; i + 1 < run.end && count == 0; ++i) {
      const ComposedLetter& a = c.letters[i];
      const ComposedLetter& b = c.letters[i + 1];
      if (a.base == U'u' && b.base == U'o') {
        targets[0] = i;
        marks[0] = Mark::Horn;
        targets[1] = i + 1;
        marks[1] = Mark::Horn;
        count = 2;
      } else if (a.base == U'o' && a.mark == Mark::None && b.base == U'a') {
        targets[0] = i + 1;
        marks[0] = Mark::Breve;
        count = 1;
      }
    }
    for (std::size_t i = run.begin; i < run.end && count == 0; ++i) {
      const char32_t b = c.letters[i].base;
      if (b == U'u' || b == U'o') {
        targets[0] = i;
        marks[0] = Mark::Horn;
        count = 1;
      } else if (b == U'a') {
        targets[0] = i;
        marks[0] = Mark::Breve;
        count = 1;
      }
    }
    if (count == 0) {
      append(k, idx, KeyUse::Literal);
      return;
    }

    bool allSet = true;
    for (std::size_t t = 0; t < count; ++t) {
      if (c.letters[targets[t]].mark != marks[t]) allSet = false;
    }
    if (allSet) {
      for (std::size_t t = 0; t < count; ++t) c.letters[targets[t]].mark = Mark::None;
      c.markLocked = true;
      append(k, idx, KeyUse::Undo);
      return;
    }
    for (std::size_t t = 0; t < count; ++t) c.letters[targets[t]].mark = marks[t];
    c.uses.push_back(KeyUse::Mark);
  }

  // a / e / o right after the same vowel: aa -> â. Tone keys may sit in
  // between since they add no letter.
  void vowel(const KeyInfo& k, int idx) {
    const bool circumflexable = k.lower == U'a' || k.lower == U'e' || k.lower == U'o';
    if (circumflexable && !c.circumflexLocked && !c.letters.empty()) {
      ComposedLetter& last = c.letters.back();
      if (last.base == k.lower) {
        if (last.mark == Mark::Circumflex) {
          last.mark = Mark::None;
          c.circumflexLocked = true;
          append(k, idx, KeyUse::Undo);
          return;
        }
        last.mark = Mark::Circumflex;
        c.uses.push_back(KeyUse::Circumflex);
        return;
      }
    }
    append(k, idx, KeyUse::Letter);
  }

  void stroke(const KeyInfo& k, int idx) {
    if (!c.strokeLocked && !c.letters.empty()) {
      ComposedLetter& last = c.letters.back();
      if (last.base == U'd' && last.mark == Mark::None) {
        last.mark = Mark::Stroke;
        c.uses.push_back(KeyUse::Stroke);
        return;
      }
      if (last.base == U'd' && last.mark == Mark::Stroke) {
        last.mark = Mark::None;
        c.strokeLocked = true;
        append(k, idx, KeyUse::Undo);
        return;
      }
    }
    append(k, idx, KeyUse::Letter);
  }
};

// An open ươ never forms a syllable on its own; thuở and huơ spell it uơ.
void settleOpenHornPair(Composition& c) {
  const std::size_t n = c.letters.size();
  if (n < 2) return;
  ComposedLetter& u = c.letters[n - 2];
  const ComposedLetter& o = c.letters[n - 1];
  if (u.base != U'u' || u.mark != Mark::Horn || o.base != U'o' || o.mark != Mark::Horn) return;

  std::u32string spelled = c.spelled();
  Syllable syl;
  if (decompose(spelled, c.tone, syl)) return;
  spelled[n - 2] = U'u';
  if (!decompose(spelled, c.tone, syl)) return;
  u.mark = Mark::None;
}

}  // namespace

Composition compose(const std::vector<KeyInfo>& keys, bool literal) {
  Composition comp;
  Composer cm{comp};
  for (std::size_t i = 0; i < keys.size(); ++i) {
    const KeyInfo& k = keys[i];
    const int idx = static_cast<int>(i);
    if (literal) {
      cm.append(k, idx, KeyUse::Literal);
      continue;
    }
    switch (k.cls) {
      case KeyClass::Tone: cm.tone(k, idx); break;
      case KeyClass::ToneClear: cm.toneClear(k, idx); break;
      case KeyClass::Mark: cm.mark(k, idx); break;
      case KeyClass::Vowel: cm.vowel(k, idx); break;
      case KeyClass::Stroke: cm.stroke(k, idx); break;
      default: cm.append(k, idx, KeyUse::Letter); break;
    }
  }
  if (!literal) settleOpenHornPair(comp);
  return comp;
}

std::u32string renderComposition(const Composition& comp, ToneStyle style,
                                 Syllable& outSyllable, bool& outDecomposed) {
  const std::u32string spelled = comp.spelled();
  outDecomposed = decompose(spelled, comp.tone, outSyllable);

  std::size_t anchor = spelled.size();
  if (outDecomposed) {
    anchor = outSyllable.nucleusStart() +
             static_cast<std::size_t>(toneAnchor(*outSyllable.pattern, outSyllable.hasFinal(), style));
  } else if (comp.tone != Tone::Level) {
    const VowelRun run = lastVowelRun(comp.letters);
    if (!run.empty()) {
      const std::u32string_view runText = std::u32string_view(spelled).substr(run.begin, run.size());
      const bool closed = run.end < spelled.size();
      anchor = run.begin + static_cast<std::size_t>(fallbackToneAnchor(runText, closed, style));
    }
  }

  std::u32string out;
  out.reserve(spelled.size());
  for (std::size_t i = 0; i < spelled.size(); ++i) {
    const char32_t ch = spelled[i];
    const bool upper = comp.letters[i].upper;
    if (isVowelLetter(ch)) {
      out.push_back(tonedVowel(ch, i == anchor ? comp.tone : Tone::Level, upper));
    } else {
      out.push_back(upper ? toUpperVn(ch) : ch);
    }
  }
  return out;
}

} // namespace tgtelex
