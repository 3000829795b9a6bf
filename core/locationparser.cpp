/*
 * This file is part of PartsLabel.
 * Copyright (C) 2025 Luisma Peramato
 *
 * PartsLabel is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * PartsLabel is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with PartsLabel. If not, see <https://www.gnu.org/licenses/>.
 */
#include "locationparser.h"

#include "stringutils.h"

#include <cstdint>

namespace {

// Length in bytes of the UTF-8 sequence starting at location[i] and its code
// point. Malformed bytes are taken one at a time.
size_t DecodeAt(std::string_view location, size_t i, uint32_t &codePoint) {
  const unsigned char lead = static_cast<unsigned char>(location[i]);
  size_t length = 1;
  codePoint = lead;
  if (lead >= 0xF8) {
    return 1;
  } else if (lead >= 0xF0) {
    length = 4;
    codePoint = lead & 0x07;
  } else if (lead >= 0xE0) {
    length = 3;
    codePoint = lead & 0x0F;
  } else if (lead >= 0xC0) {
    length = 2;
    codePoint = lead & 0x1F;
  }
  if (length == 1 || i + length > location.size()) {
    codePoint = lead;
    return 1;
  }
  for (size_t k = 1; k < length; ++k) {
    const unsigned char next = static_cast<unsigned char>(location[i + k]);
    if ((next & 0xC0) != 0x80) {
      codePoint = lead;
      return 1;
    }
    codePoint = (codePoint << 6) | (next & 0x3F);
  }
  return length;
}

// Unicode White_Space plus the ASCII information separators 0x1C..0x1F,
// which spreadsheet exports also use between fields.
bool IsWhitespace(uint32_t cp) {
  if (cp < 0x80)
    return StringUtils::IsSpace(static_cast<char>(cp)) ||
           (cp >= 0x1C && cp <= 0x1F);
  switch (cp) {
  case 0x85:
  case 0xA0:
  case 0x1680:
  case 0x2028:
  case 0x2029:
  case 0x202F:
  case 0x205F:
  case 0x3000:
    return true;
  default:
    return cp >= 0x2000 && cp <= 0x200A;
  }
}

bool IsSeparator(uint32_t cp) { return cp == '_' || IsWhitespace(cp); }

} // namespace

namespace LocationParser {

LocationFields Parse(std::string_view location) {
  LocationFields fields;
  size_t field = 0;
  size_t start = 0;
  size_t i = 0;
  bool inToken = false;
  while (i < location.size() && field < fields.size()) {
    uint32_t cp = 0;
    const size_t length = DecodeAt(location, i, cp);
    if (IsSeparator(cp)) {
      if (inToken)
        fields[field++] = std::string(location.substr(start, i - start));
      inToken = false;
    } else if (!inToken) {
      start = i;
      inToken = true;
    }
    i += length;
  }
  if (inToken && field < fields.size())
    fields[field] = std::string(location.substr(start));
  return fields;
}

} // namespace LocationParser
