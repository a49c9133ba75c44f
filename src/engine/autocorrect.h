/*
TGTelex — Dictionary auto-correct for finalized words.
Copyright 2025-2026 Tamas Geczy.
Licensed under the MIT License. See LICENSE for details.
*/

#ifndef TGTELEX_ENGINE_AUTOCORRECT_H
#define TGTELEX_ENGINE_AUTOCORRECT_H

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>

namespace tgtelex {

enum class AutoCorrectMode : int {
  Off = 0,
  Vietnamese = 1,
  English = 2,
  All = 3,
};

// Unknown codes map to Off.
AutoCorrectMode autoCorrectModeFromCode(int code);
int autoCorrectModeCode(AutoCorrectMode mode);

// Accepts off / vietnamese / english / all (any case) or a digit 0-3.
bool parseAutoCorrectMode(std::string_view text, AutoCorrectMode& out);

struct CorrectionEntry {
  const char* wrong;
  const char* right;
};

extern const CorrectionEntry kVietnameseCorrections[];
extern const std::size_t kVietnameseCorrectionCount;
extern const CorrectionEntry kEnglishCorrections[];
extern const std::size_t kEnglishCorrectionCount;

using CorrectionMap = std::unordered_map<std::string, std::string>;

// Lookup maps built once from the compiled-in tables. Immutable after
// construction, so one instance is shared by every engine.
class CorrectionTables {
public:
  CorrectionTables();

  const CorrectionMap& vietnamese() const { return vi_; }
  const CorrectionMap& english() const { return en_; }
  const CorrectionMap& all() const { return all_; }

  // nullptr for Off.
  const CorrectionMap* forMode(AutoCorrectMode mode) const;

private:
  CorrectionMap vi_;
  CorrectionMap en_;
  CorrectionMap all_;
};

struct CorrectionResult {
  std::string original;
  std::string corrected;
  std::size_t backspaceCount = 0;  // code points of original
};

class AutoCorrect {
public:
  explicit AutoCorrect(std::shared_ptr<const CorrectionTables> tables);

  void setMode(AutoCorrectMode mode);
  AutoCorrectMode mode() const { return mode_; }
  bool isEnabled() const { return mode_ != AutoCorrectMode::Off; }

  // word is UTF-8. Returns false when disabled, empty, or not in the table.
  bool tryCorrect(std::string_view word, CorrectionResult& out) const;

  // Entries in the active table (0 when Off).
  std::size_t correctionsCount() const;

private:
  std::shared_ptr<const CorrectionTables> tables_;
  AutoCorrectMode mode_ = AutoCorrectMode::Off;
  const CorrectionMap* active_ = nullptr;
};

// Carry the case pattern of original over to corrected:
// TEH -> THE, Teh -> The, teh -> the.
std::string applyCase(std::string_view original, std::string_view corrected);

} // namespace tgtelex

#endif
