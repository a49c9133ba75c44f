/*
TGTelex — Vietnamese letter tables (marks, tones, case).
Copyright 2025-2026 Tamas Geczy.
Licensed under the MIT License. See LICENSE for details.
*/

#include "vnchars.h"

#include <cstddef>

namespace tgtelex {

namespace {

struct VowelRow {
  char32_t letter;        // lowercase, no tone
  char32_t lower[6];      // indexed by Tone
  char32_t upper[6];
};

// Precomposed forms (NFC). Columns: level, acute, grave, hook, tilde, dot.
const VowelRow kVowels[] = {
  {U'a',
   {U'a', U'á', U'à', U'ả', U'ã', U'ạ'},
   {U'A', U'Á', U'À', U'Ả', U'Ã', U'Ạ'}},
  {U'ă',
   {U'ă', U'ắ', U'ằ', U'ẳ', U'ẵ', U'ặ'},
   {U'Ă', U'Ắ', U'Ằ', U'Ẳ', U'Ẵ', U'Ặ'}},
  {U'â',
   {U'â', U'ấ', U'ầ', U'ẩ', U'ẫ', U'ậ'},
   {U'Â', U'Ấ', U'Ầ', U'Ẩ', U'Ẫ', U'Ậ'}},
  {U'e',
   {U'e', U'é', U'è', U'ẻ', U'ẽ', U'ẹ'},
   {U'E', U'É', U'È', U'Ẻ', U'Ẽ', U'Ẹ'}},
  {U'ê',
   {U'ê', U'ế', U'ề', U'ể', U'ễ', U'ệ'},
   {U'Ê', U'Ế', U'Ề', U'Ể', U'Ễ', U'Ệ'}},
  {U'i',
   {U'i', U'í', U'ì', U'ỉ', U'ĩ', U'ị'},
   {U'I', U'Í', U'Ì', U'Ỉ', U'Ĩ', U'Ị'}},
  {U'o',
   {U'o', U'ó', U'ò', U'ỏ', U'õ', U'ọ'},
   {U'O', U'Ó', U'Ò', U'Ỏ', U'Õ', U'Ọ'}},
  {U'ô',
   {U'ô', U'ố', U'ồ', U'ổ', U'ỗ', U'ộ'},
   {U'Ô', U'Ố', U'Ồ', U'Ổ', U'Ỗ', U'Ộ'}},
  {U'ơ',
   {U'ơ', U'ớ', U'ờ', U'ở', U'ỡ', U'ợ'},
   {U'Ơ', U'Ớ', U'Ờ', U'Ở', U'Ỡ', U'Ợ'}},
  {U'u',
   {U'u', U'ú', U'ù', U'ủ', U'ũ', U'ụ'},
   {U'U', U'Ú', U'Ù', U'Ủ', U'Ũ', U'Ụ'}},
  {U'ư',
   {U'ư', U'ứ', U'ừ', U'ử', U'ữ', U'ự'},
   {U'Ư', U'Ứ', U'Ừ', U'Ử', U'Ữ', U'Ự'}},
  {U'y',
   {U'y', U'ý', U'ỳ', U'ỷ', U'ỹ', U'ỵ'},
   {U'Y', U'Ý', U'Ỳ', U'Ỷ', U'Ỹ', U'Ỵ'}},
};

constexpr char32_t kLowerD = U'đ';
constexpr char32_t kUpperD = U'Đ';

const VowelRow* findRow(char32_t letter) {
  for (const VowelRow& row : kVowels) {
    if (row.letter == letter) return &row;
  }
  return nullptr;
}

// Locate c anywhere in the vowel table. Sets row and case on success.
bool locate(char32_t c, const VowelRow*& outRow, bool& outUpper) {
  for (const VowelRow& row : kVowels) {
    for (std::size_t t = 0; t < 6; ++t) {
      if (row.lower[t] == c) {
        outRow = &row;
        outUpper = false;
        return true;
      }
      if (row.upper[t] == c) {
        outRow = &row;
        outUpper = true;
        return true;
      }
    }
  }
  return false;
}

}  // namespace

bool isVowelBase(char32_t c) {
  switch (c) {
    case U'a': case U'e': case U'i': case U'o': case U'u': case U'y':
      return true;
    default:
      return false;
  }
}

char32_t markedLetter(char32_t base, Mark mark) {
  switch (mark) {
    case Mark::None:
      return base;
    case Mark::Circumflex:
      if (base == U'a') return U'â';
      if (base == U'e') return U'ê';
      if (base == U'o') return U'ô';
      return 0;
    case Mark::Horn:
      if (base == U'o') return U'ơ';
      if (base == U'u') return U'ư';
      return 0;
    case Mark::Breve:
      return base == U'a' ? U'ă' : 0;
    case Mark::Stroke:
      return base == U'd' ? kLowerD : 0;
  }
  return 0;
}

char32_t tonedVowel(char32_t markedLower, Tone tone, bool upper) {
  const VowelRow* row = findRow(markedLower);
  if (!row) return 0;
  const int t = static_cast<int>(tone);
  return upper ? row->upper[t] : row->lower[t];
}

char32_t toLowerVn(char32_t c) {
  if (c >= U'A' && c <= U'Z') return c + 32;
  if (c < 0x80) return c;
  if (c == kUpperD) return kLowerD;
  const VowelRow* row = nullptr;
  bool upper = false;
  if (!locate(c, row, upper) || !upper) return c;
  for (std::size_t t = 0; t < 6; ++t) {
    if (row->upper[t] == c) return row->lower[t];
  }
  return c;
}

char32_t toUpperVn(char32_t c) {
  if (c >= U'a' && c <= U'z') return c - 32;
  if (c < 0x80) return c;
  if (c == kLowerD) return kUpperD;
  const VowelRow* row = nullptr;
  bool upper = false;
  if (!locate(c, row, upper) || upper) return c;
  for (std::size_t t = 0; t < 6; ++t) {
    if (row->lower[t] == c) return row->upper[t];
  }
  return c;
}

bool isUpperVn(char32_t c) {
  if (c >= U'A' && c <= U'Z') return true;
  if (c < 0x80) return false;
  if (c == kUpperD) return true;
  const VowelRow* row = nullptr;
  bool upper = false;
  return locate(c, row, upper) && upper;
}

bool isLetterVn(char32_t c) {
  if ((c >= U'a' && c <= U'z') || (c >= U'A' && c <= U'Z')) return true;
  if (c < 0x80) return false;
  if (c == kLowerD || c == kUpperD) return true;
  const VowelRow* row = nullptr;
  bool upper = false;
  return locate(c, row, upper);
}

std::u32string lowerVn(std::u32string_view s) {
  std::u32string out;
  out.reserve(s.size());
  for (char32_t c : s) out.push_back(toLowerVn(c));
  return out;
}

std::u32string upperVn(std::u32string_view s) {
  std::u32string out;
  out.reserve(s.size());
  for (char32_t c : s) out.push_back(toUpperVn(c));
  return out;
}

} // namespace tgtelex
