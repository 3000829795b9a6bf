#include "paginator.h"

#include <cassert>
#include <string>

int main() {
  {
    Paginator paginator;
    assert(paginator.Empty());
    for (int i = 0; i < 9; ++i) {
      LabelBlock block;
      block.locationKey = "L" + std::to_string(i);
      paginator.Add(std::move(block));
    }
    assert(paginator.BlockCount() == 9);

    const auto pages = paginator.TakePages();
    assert(pages.size() == 3);
    assert(pages[0].blocks.size() == 4);
    assert(pages[1].blocks.size() == 4);
    assert(pages[2].blocks.size() == 1);
    assert(pages[0].blocks[0].locationKey == "L0");
    assert(pages[1].blocks[0].locationKey == "L4");
    assert(pages[2].blocks[0].locationKey == "L8");
    assert(paginator.Empty());
  }

  // Exactly full pages leave no trailing empty page.
  {
    Paginator paginator;
    for (int i = 0; i < 8; ++i)
      paginator.Add(LabelBlock{});
    assert(paginator.TakePages().size() == 2);
  }

  {
    Paginator paginator;
    assert(paginator.TakePages().empty());
  }

  return 0;
}
