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
#include "paginator.h"

#include <utility>

Paginator::Paginator(size_t blocksPerPage)
    : blocksPerPage_(blocksPerPage > 0 ? blocksPerPage : kBlocksPerPage) {}

void Paginator::Add(LabelBlock block) {
  if (pages_.empty() ||
      (blockCount_ > 0 && blockCount_ % blocksPerPage_ == 0))
    pages_.emplace_back();
  pages_.back().blocks.push_back(std::move(block));
  ++blockCount_;
}

std::vector<LabelPage> Paginator::TakePages() {
  std::vector<LabelPage> pages = std::move(pages_);
  pages_.clear();
  blockCount_ = 0;
  return pages;
}
