#include "configservices.h"
#include "labelstyle.h"

#include <cassert>
#include <cmath>

namespace {
bool Near(double a, double b) { return std::abs(a - b) < 1e-9; }
} // namespace

int main() {
  {
    const LabelStyle v1 = LabelStyle::Defaults(LabelVariant::MultiplePart);
    assert(v1.bucketDescriptions);
    assert(v1.partNumberSmallSize == 17.0 && v1.partNumberLargeSize == 22.0);
    const auto widths = v1.LocationColumnWidths();
    assert(widths.size() == 8);
    assert(Near(widths[0], 4.0));
    // 1.8 of 11 total weight units spread over 11 cm.
    assert(Near(widths[1], 1.8));
    assert(Near(widths[2], 2.7));
    assert(Near(widths[7], 1.3));
  }

  {
    const LabelStyle v2 = LabelStyle::Defaults(LabelVariant::SinglePart);
    assert(!v2.bucketDescriptions);
    assert(v2.partNumberRowHeight == 1.9 && v2.descriptionRowHeight == 2.1);
    assert(v2.locationRowHeight == 0.9);
    assert(v2.partNumberTrailingBreaks == 2);
    assert(v2.locationFieldFontSize == 16.0);
  }

  {
    const LabelColor salmon = ColorFromHex("#E9967A");
    assert(Near(salmon.r, 0xE9 / 255.0));
    assert(Near(salmon.g, 0x96 / 255.0));
    assert(Near(salmon.b, 0x7A / 255.0));
    const auto palette = DefaultLocationPalette();
    const char *hex[] = {"#E9967A", "#ADD8E6", "#90EE90", "#FFD700",
                         "#ADD8E6", "#E9967A", "#90EE90"};
    for (size_t i = 0; i < palette.size(); ++i) {
      const LabelColor expected = ColorFromHex(hex[i]);
      assert(Near(palette[i].r, expected.r) && Near(palette[i].g, expected.g) &&
             Near(palette[i].b, expected.b));
    }
    assert(Near(palette[3].r, 1.0) && Near(palette[3].g, 0xD7 / 255.0) &&
           Near(palette[3].b, 0.0));
  }

  {
    assert(ParseLocationWeights("1,2,3,4,5,6,7"));
    assert(!ParseLocationWeights("1,2,3,4,5,6"));
    assert(!ParseLocationWeights("1,2,3,4,5,6,7,8"));
    assert(!ParseLocationWeights("1,2,3,4,5,6,0"));
    assert(!ParseLocationWeights("1,2,3,4,5,6,x"));
    const auto parsed = ParseLocationWeights(" 1.5, 2,3,4,5,6,7 ");
    assert(parsed && Near((*parsed)[0], 1.5));
    assert(FormatLocationWeights(*parsed) == "1.5,2,3,4,5,6,7");
  }

  {
    UserPreferencesStore prefs;
    prefs.SetFloat(LabelStyleKeys::PartColumnWidth, 5.0f);
    prefs.SetValue(LabelStyleKeys::LocationWeights(LabelVariant::MultiplePart),
                   "1,1,1,1,1,1,1");
    const LabelStyle style =
        LabelStyle::FromPreferences(prefs, LabelVariant::MultiplePart);
    assert(Near(style.partColumnWidth, 5.0));
    const auto widths = style.LocationColumnWidths();
    assert(Near(widths[0], 5.0));
    assert(Near(widths[3], 11.0 / 7.0));

    prefs.SetValue(LabelStyleKeys::LocationWeights(LabelVariant::SinglePart),
                   "garbage");
    const LabelStyle v2 =
        LabelStyle::FromPreferences(prefs, LabelVariant::SinglePart);
    assert(Near(v2.locationWeights[1], 2.9));
  }

  return 0;
}
