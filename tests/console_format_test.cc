#include "iptcinfo/console_format.h"

#include <gtest/gtest.h>

#include <string>

namespace iptcinfo {

TEST(ConsoleFormatTest, QuotesPlainText)
{
    std::string out;
    EXPECT_FALSE(append_console_quoted("Oslo \"west\" \\ side", 0, &out));
    EXPECT_EQ(out, "\"Oslo \\\"west\\\" \\\\ side\"");
}


TEST(ConsoleFormatTest, EscapesControlAndLatin1Bytes)
{
    std::string out;
    EXPECT_TRUE(append_console_quoted(std::string_view("a\nb\t\x01S\xE3o\x7F"),
                                      0, &out));
    EXPECT_EQ(out, "\"a\\nb\\t\\x01S\\xE3o\\x7F\"");
}


TEST(ConsoleFormatTest, TruncatesInsideQuotes)
{
    std::string out;
    EXPECT_TRUE(append_console_quoted("headline", 4, &out));
    EXPECT_EQ(out, "\"head...\"");

    out.clear();
    EXPECT_FALSE(append_console_quoted("head", 4, &out));
    EXPECT_EQ(out, "\"head\"");
}


TEST(ConsoleFormatTest, ReportsScalarsThenListValues)
{
    IptcInfo info;
    info.set_scalar("headline", "Storm");
    info.set_scalar("city", "Bergen\r");
    info.append_list("keywords", "rain");
    info.append_list("keywords", "rain");
    info.append_list("supplemental category", "weather");

    std::string out;
    append_iptc_text_report(info, 0, &out);
    EXPECT_EQ(out,
              "city: \"Bergen\\r\"\n"
              "headline: \"Storm\"\n"
              "keywords[0]: \"rain\"\n"
              "keywords[1]: \"rain\"\n"
              "supplemental category[0]: \"weather\"\n");
}

}  // namespace iptcinfo
