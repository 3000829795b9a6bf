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

#include "labeldocument.h"

#include <vector>

// Collects label blocks into fixed-capacity pages in arrival order.
class Paginator {
public:
  static constexpr size_t kBlocksPerPage = 4;

  explicit Paginator(size_t blocksPerPage = kBlocksPerPage);

  // Place a block, starting a new page first when the running block count
  // is a positive multiple of the page capacity.
  void Add(LabelBlock block);

  size_t BlockCount() const { return blockCount_; }
  bool Empty() const { return blockCount_ == 0; }

  // Hand over the pages collected so far and start over.
  std::vector<LabelPage> TakePages();

private:
  size_t blocksPerPage_;
  size_t blockCount_ = 0;
  std::vector<LabelPage> pages_;
};
