/*
TGTelex — UTF-8 encoding and decoding utilities.
Copyright 2025-2026 Tamas Geczy.
Licensed under the MIT License. See LICENSE for details.
*/

#ifndef TGTELEX_ENGINE_UTF8_H
#define TGTELEX_ENGINE_UTF8_H

#include <cstddef>
#include <string>
#include <string_view>

namespace tgtelex {

// Best-effort UTF-8 -> UTF-32. Invalid sequences become U+FFFD.
std::u32string utf8ToU32(std::string_view s);

// UTF-32 -> UTF-8.
std::string u32ToUtf8(std::u32string_view s);

// Number of code points in a UTF-8 string (invalid bytes count as one each).
std::size_t utf8Length(std::string_view s);

} // namespace tgtelex

#endif
