/*
TGTelex — UTF-8 encoding and decoding utilities.
Copyright 2025-2026 Tamas Geczy.
Licensed under the MIT License. See LICENSE for details.
*/

#include "utf8.h"

#include <cstdint>

namespace tgtelex {

static constexpr char32_t kReplacementChar = 0xFFFD;

// Length of the sequence introduced by a lead byte, 0 for an invalid lead.
static int sequenceLength(unsigned char c0) {
  if (c0 < 0x80) return 1;
  if ((c0 >> 5) == 0x6) return 2;
  if ((c0 >> 4) == 0xE) return 3;
  if ((c0 >> 3) == 0x1E) return 4;
  return 0;
}

std::u32string utf8ToU32(std::string_view s) {
  std::u32string out;
  out.reserve(s.size());

  const unsigned char* p = reinterpret_cast<const unsigned char*>(s.data());
  const unsigned char* end = p + s.size();

  while (p < end) {
    const unsigned char c0 = *p++;
    const int len = sequenceLength(c0);
    if (len == 1) {
      out.push_back(static_cast<char32_t>(c0));
      continue;
    }
    if (len == 0) {
      out.push_back(kReplacementChar);
      continue;
    }
    if (end - p < len - 1) {
      // Truncated tail.
      out.push_back(kReplacementChar);
      break;
    }

    static const unsigned char kLeadMask[5] = {0, 0, 0x1F, 0x0F, 0x07};
    uint32_t cp = c0 & kLeadMask[len];
    bool ok = true;
    for (int i = 1; i < len; ++i) {
      const unsigned char cn = *p++;
      if ((cn & 0xC0) != 0x80) {
        ok = false;
        break;
      }
      cp = (cp << 6) | (cn & 0x3F);
    }
    if (!ok) {
      out.push_back(kReplacementChar);
      continue;
    }

    // Overlong forms, surrogate halves and out-of-range values.
    static const uint32_t kMinForLen[5] = {0, 0, 0x80, 0x800, 0x10000};
    if (cp < kMinForLen[len] || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
      out.push_back(kReplacementChar);
      continue;
    }
    out.push_back(static_cast<char32_t>(cp));
  }

  return out;
}

std::string u32ToUtf8(std::u32string_view s) {
  std::string out;
  out.reserve(s.size());

  for (char32_t ch : s) {
    uint32_t cp = static_cast<uint32_t>(ch);
    if (cp <= 0x7F) {
      out.push_back(static_cast<char>(cp));
    } else if (cp <= 0x7FF) {
      out.push_back(static_cast<char>(0xC0 | ((cp >> 6) & 0x1F)));
      out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp <= 0xFFFF) {
      out.push_back(static_cast<char>(0xE0 | ((cp >> 12) & 0x0F)));
      out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
      out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
      out.push_back(static_cast<char>(0xF0 | ((cp >> 18) & 0x07)));
      out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
      out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
      out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
  }

  return out;
}

std::size_t utf8Length(std::string_view s) {
  return utf8ToU32(s).size();
}

} // namespace tgtelex
