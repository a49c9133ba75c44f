/*
TGTelex — Dictionary auto-correct for finalized words.
Copyright 2025-2026 Tamas Geczy.
Licensed under the MIT License. See LICENSE for details.
*/

#include "autocorrect.h"

#include <cctype>
#include <utility>

#include "utf8.h"
#include "vnchars.h"

namespace tgtelex {

AutoCorrectMode autoCorrectModeFromCode(int code) {
  switch (code) {
    case 1: return AutoCorrectMode::Vietnamese;
    case 2: return AutoCorrectMode::English;
    case 3: return AutoCorrectMode::All;
    default: return AutoCorrectMode::Off;
  }
}

int autoCorrectModeCode(AutoCorrectMode mode) {
  return static_cast<int>(mode);
}

bool parseAutoCorrectMode(std::string_view text, AutoCorrectMode& out) {
  std::string s;
  s.reserve(text.size());
  for (char c : text) s.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));

  if (s == "off" || s == "0" || s == "none") {
    out = AutoCorrectMode::Off;
  } else if (s == "vietnamese" || s == "vi" || s == "1") {
    out = AutoCorrectMode::Vietnamese;
  } else if (s == "english" || s == "en" || s == "2") {
    out = AutoCorrectMode::English;
  } else if (s == "all" || s == "3") {
    out = AutoCorrectMode::All;
  } else {
    return false;
  }
  return true;
}

static void fillMap(CorrectionMap& map, const CorrectionEntry* entries, std::size_t count) {
  map.reserve(map.size() + count);
  for (std::size_t i = 0; i < count; ++i) {
    map.emplace(entries[i].wrong, entries[i].right);
  }
}

CorrectionTables::CorrectionTables() {
  fillMap(vi_, kVietnameseCorrections, kVietnameseCorrectionCount);
  fillMap(en_, kEnglishCorrections, kEnglishCorrectionCount);
  all_ = vi_;
  all_.insert(en_.begin(), en_.end());
}

const CorrectionMap* CorrectionTables::forMode(AutoCorrectMode mode) const {
  switch (mode) {
    case AutoCorrectMode::Vietnamese: return &vi_;
    case AutoCorrectMode::English: return &en_;
    case AutoCorrectMode::All: return &all_;
    case AutoCorrectMode::Off: break;
  }
  return nullptr;
}

AutoCorrect::AutoCorrect(std::shared_ptr<const CorrectionTables> tables)
    : tables_(std::move(tables)) {}

void AutoCorrect::setMode(AutoCorrectMode mode) {
  mode_ = mode;
  active_ = tables_ ? tables_->forMode(mode) : nullptr;
}

bool AutoCorrect::tryCorrect(std::string_view word, CorrectionResult& out) const {
  if (!active_ || word.empty()) return false;

  const std::u32string wide = utf8ToU32(word);
  const auto it = active_->find(u32ToUtf8(lowerVn(wide)));
  if (it == active_->end()) return false;

  out.original.assign(word);
  out.corrected = applyCase(word, it->second);
  out.backspaceCount = wide.size();
  return true;
}

std::size_t AutoCorrect::correctionsCount() const {
  return active_ ? active_->size() : 0;
}

std::string applyCase(std::string_view original, std::string_view corrected) {
  if (original.empty() || corrected.empty()) return std::string(corrected);

  const std::u32string orig = utf8ToU32(original);
  bool allUpper = true;
  for (char32_t c : orig) {
    if (isLetterVn(c) && !isUpperVn(c)) {
      allUpper = false;
      break;
    }
  }
  if (allUpper) return u32ToUtf8(upperVn(utf8ToU32(corrected)));

  if (isUpperVn(orig.front())) {
    std::u32string out = utf8ToU32(corrected);
    out[0] = toUpperVn(out[0]);
    return u32ToUtf8(out);
  }
  return std::string(corrected);
}

} // namespace tgtelex
