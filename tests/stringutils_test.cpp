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
#include "../core/stringutils.h"
#include <cassert>
#include <string>

int main() {
  using namespace StringUtils;

  assert(Trim("  a b \t\n") == "a b");
  assert(Trim("   ").empty());
  assert(ToUpperCopy("Part No.") == "PART NO.");

  // "Å" is two bytes, one code point.
  const std::string text = "x\xC3\x85yz";
  assert(Utf8Length(text) == 4);
  assert(Utf8Offset(text, 2) == 3);
  assert(Utf8Offset(text, 10) == text.size());
  assert(Utf8Substr(text, 1, 1) == "\xC3\x85");
  assert(Utf8Substr(text, 2) == "yz");
  assert(Utf8Substr(text, 0, 100) == text);

  return 0;
}
