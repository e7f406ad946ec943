#include "pdf_graphics_encoder.h"

#include <cassert>
#include <string>
#include <vector>

using namespace svgpdf;

// Counts parentheses that are not preceded by an escaping backslash.
static int UnescapedParens(const std::string &s) {
  int count = 0;
  bool escaped = false;
  for (char c : s) {
    if (escaped) {
      escaped = false;
      continue;
    }
    if (c == '\\')
      escaped = true;
    else if (c == '(' || c == ')')
      ++count;
  }
  return count;
}

int main() {
  assert(EscapePdfString("Hi(there)") == "Hi\\(there\\)");
  assert(EscapePdfString("a\\b") == "a\\\\b");
  assert(EscapePdfString("\\(") == "\\\\\\(");
  assert(EscapePdfString("plain text") == "plain text");
  assert(EscapePdfString("") == "");
  for (const char *sample : {"(", ")", "((x))", "\\)", "a(b\\c)d", ")\\("})
    assert(UnescapedParens(EscapePdfString(sample)) == 0);

  FloatFormatter fmt(2);
  assert(fmt.Format(595.0) == "595.00");
  assert(fmt.Format(0.0) == "0.00");
  assert(FloatFormatter(3).Format(1.5) == "1.500");

  Mapping identity = MakeMapping(595.0, 842.0, 595.0, 842.0);

  {
    std::vector<std::string> lines;
    AppendRectangle(lines, fmt, identity, SvgRect{10.0, 20.0, 30.0, 40.0});
    const std::vector<std::string> expected = {
        "10.00 822.00 m", "40.00 822.00 l", "40.00 782.00 l",
        "10.00 782.00 l", "h",              "0 0 0 RG",
        "S"};
    assert(lines == expected);
  }

  {
    std::vector<std::string> lines;
    SvgText text;
    text.x = 10.0;
    text.y = 10.0;
    text.content = "A(b)";
    AppendText(lines, fmt, identity, text, 12.0);
    // (10, 832) after the flip, then rotated to (832, 585).
    const std::vector<std::string> expected = {
        "BT", "/F1 12.00 Tf", "832.00 585.00 Td", "(A\\(b\\)) Tj", "ET"};
    assert(lines == expected);
  }

  {
    std::vector<std::string> lines;
    AppendGradientPlaceholder(lines, fmt);
    const std::vector<std::string> expected = {
        "100.00 100.00 200.00 50.00 re", "0 0 1 RG", "S"};
    assert(lines == expected);
  }

  return 0;
}
