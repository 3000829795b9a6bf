#include "labelstyle.h"
#include "stringutils.h"
#include "typography.h"

#include <cassert>
#include <string>

int main() {
  const LabelStyle v1 = LabelStyle::Defaults(LabelVariant::MultiplePart);
  const LabelStyle v2 = LabelStyle::Defaults(LabelVariant::SinglePart);

  {
    const auto d = Typography::SelectPartNumber("AB12345", v1);
    assert(d.IsSplit());
    assert(d.prefix == "AB" && d.suffix == "12345");
    assert(d.prefixSize == 17.0 && d.suffixSize == 22.0);
    assert(d.splitPoint == 2);

    const auto runs = Typography::PartNumberRuns(d);
    assert(runs.size() == 2);
    assert(runs[0].bold && runs[1].bold);
    assert(runs[0].text + runs[1].text == "AB12345");
  }

  {
    const auto d = Typography::SelectPartNumber("AB12345", v2);
    assert(d.prefixSize == 34.0 && d.suffixSize == 40.0);
  }

  // Five characters or fewer print whole at the small size.
  {
    const auto d = Typography::SelectPartNumber("12345", v1);
    assert(!d.IsSplit());
    assert(d.suffix == "12345" && d.suffixSize == 17.0);
    assert(Typography::PartNumberRuns(d).size() == 1);
  }

  // The split counts characters, not bytes.
  {
    const std::string number = "\xC3\x85\xC3\x85-1234";
    const auto d = Typography::SelectPartNumber(number, v1);
    assert(d.prefix == "\xC3\x85\xC3\x85");
    assert(d.suffix == "-1234");
    assert(d.prefix + d.suffix == number);
  }

  // Length buckets of multiple part labels.
  {
    assert(Typography::SelectDescription(std::string(30, 'x'), v1).fontSize ==
           15.0);
    assert(Typography::SelectDescription(std::string(31, 'x'), v1).fontSize ==
           13.0);
    assert(Typography::SelectDescription(std::string(70, 'x'), v1).fontSize ==
           11.0);
    assert(Typography::SelectDescription(std::string(90, 'x'), v1).fontSize ==
           10.0);
    const auto d = Typography::SelectDescription(std::string(91, 'x'), v1);
    assert(d.fontSize == 9.0 && d.leading == 11.0 && !d.truncated);
  }

  {
    const std::string longText(150, 'y');
    const auto d = Typography::SelectDescription(longText, v1);
    assert(d.truncated);
    assert(d.text == std::string(100, 'y') + "...");
    assert(StringUtils::Utf8Length(d.text) == 103);
  }

  {
    const auto d = Typography::SelectDescription(std::string(100, 'z'), v1);
    assert(!d.truncated && d.text.size() == 100);
  }

  // Single part labels keep the full text at a fixed size.
  {
    const std::string longText(150, 'y');
    const auto d = Typography::SelectDescription(longText, v2);
    assert(!d.truncated);
    assert(d.text == longText);
    assert(d.fontSize == 20.0 && d.leading == 16.0);
  }

  return 0;
}
