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
#pragma once

#include "partrecord.h"

#include <string_view>

namespace LocationParser {

// Split a location code into its positional fields. Tokens are separated by
// runs of Unicode whitespace (no-break spaces included) and underscores, so "12M R 0 2 A 1" and
// "12M_ST-140_R_0_2_A_1" both parse; dashes stay inside tokens. Tokens past
// the seventh are dropped and missing ones are left empty.
LocationFields Parse(std::string_view location);

} // namespace LocationParser
