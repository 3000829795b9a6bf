#include "columnresolver.h"

#include <cassert>
#include <string>
#include <vector>

int main() {
  using ColumnResolver::Resolve;

  {
    const auto sel = Resolve({"Qty", "Part Number", "Item Description",
                              "Storage Location"});
    assert(sel.partNumber == 1);
    assert(sel.description == 2);
    assert(sel.location == 3);
    assert(sel.Describe() ==
           "Using columns: Part No: PART NUMBER, Description: ITEM "
           "DESCRIPTION, Location: STORAGE LOCATION");
  }

  // Case-insensitive, '#' counts as a number marker, POS means location.
  {
    const auto sel = Resolve({"part #", "desc", "bin pos"});
    assert(sel.partNumber == 0);
    assert(sel.description == 1);
    assert(sel.location == 2);
  }

  // Bare "PART" is accepted as a second chance.
  {
    const auto sel = Resolve({"Vendor", "Part", "Description", "Loc"});
    assert(sel.partNumber == 1);
    assert(sel.location == 3);
  }

  // Unknown headers fall back to position.
  {
    const auto sel = Resolve({"A", "B", "C", "D"});
    assert(sel.partNumber == 0);
    assert(sel.description == 1);
    assert(sel.location == 2);
  }

  // Two columns: the location reuses the description column.
  {
    const auto sel = Resolve({"A", "B"});
    assert(sel.partNumber == 0);
    assert(sel.description == 1);
    assert(sel.location == 1);
  }

  // One column serves every role.
  {
    const auto sel = Resolve({"Only"});
    assert(sel.partNumber == 0 && sel.description == 0 && sel.location == 0);
  }

  // First match wins.
  {
    const auto sel = Resolve({"Part No", "Part Num", "Desc 1", "Desc 2",
                              "Location A", "Location B"});
    assert(sel.partNumber == 0);
    assert(sel.description == 2);
    assert(sel.location == 4);
  }

  {
    const auto sel = Resolve({});
    assert(!sel.Valid());
  }

  return 0;
}
