#include "iptcinfo/iptc_export.h"

#include "iptcinfo/byte_source.h"
#include "iptcinfo/iptc_read.h"

#include <gtest/gtest.h>

#include <expat.h>

#include <cstddef>
#include <string>
#include <vector>

namespace iptcinfo {
namespace {

    struct ParsedElement final {
        std::string name;
        std::string text;
        int depth = 0;
    };

    struct ParseContext final {
        std::vector<ParsedElement> elements;
        std::vector<size_t> open;
    };

    static void XMLCALL start_element(void* user_data, const XML_Char* name,
                                      const XML_Char** /*atts*/)
    {
        ParseContext* ctx = static_cast<ParseContext*>(user_data);
        ParsedElement e;
        e.name  = name;
        e.depth = static_cast<int>(ctx->open.size());
        ctx->open.push_back(ctx->elements.size());
        ctx->elements.push_back(e);
    }

    static void XMLCALL end_element(void* user_data, const XML_Char* /*name*/)
    {
        ParseContext* ctx = static_cast<ParseContext*>(user_data);
        if (!ctx->open.empty()) {
            ctx->open.pop_back();
        }
    }

    static void XMLCALL char_data(void* user_data, const XML_Char* s, int len)
    {
        ParseContext* ctx = static_cast<ParseContext*>(user_data);
        if (ctx->open.empty() || len <= 0) {
            return;
        }
        ctx->elements[ctx->open.back()].text.append(
            s, static_cast<size_t>(len));
    }

    static bool parse_xml(const std::string& xml, ParseContext* ctx)
    {
        XML_Parser parser = XML_ParserCreate(nullptr);
        if (!parser) {
            return false;
        }
        XML_SetUserData(parser, ctx);
        XML_SetElementHandler(parser, &start_element, &end_element);
        XML_SetCharacterDataHandler(parser, &char_data);
        const XML_Status st = XML_Parse(parser, xml.data(),
                                        static_cast<int>(xml.size()),
                                        XML_TRUE);
        XML_ParserFree(parser);
        return st == XML_STATUS_OK;
    }

}  // namespace

TEST(IptcExportExpatTest, XmlExportIsWellFormed)
{
    IptcInfo info;
    info.set_scalar("caption/abstract", "5 < 6 & \"quotes\" 'too'");
    info.set_scalar("country/primary location name", "Norway");
    info.set_scalar("by-line", "J. Carter");
    info.append_list("keywords", "a&b");
    info.append_list("keywords", "<c>");
    info.append_list("supplemental category", "x");

    const std::vector<IptcExportField> extra = { { "id", "42" } };
    std::string xml;
    ASSERT_EQ(export_iptc_xml(info, "photo", extra, &xml),
              IptcExportStatus::Ok);

    ParseContext ctx;
    ASSERT_TRUE(parse_xml(xml, &ctx)) << xml;
    ASSERT_FALSE(ctx.elements.empty());
    EXPECT_EQ(ctx.elements[0].name, "photo");

    std::vector<std::string> keywords;
    bool saw_caption = false;
    bool saw_country = false;
    for (const ParsedElement& e : ctx.elements) {
        if (e.name == "caption-abstract") {
            saw_caption = true;
            EXPECT_EQ(e.depth, 1);
            EXPECT_EQ(e.text, "5 < 6 & \"quotes\" 'too'");
        }
        if (e.name == "country-primary_location_name") {
            saw_country = true;
            EXPECT_EQ(e.text, "Norway");
        }
        if (e.name == "keyword") {
            EXPECT_EQ(e.depth, 2);
            keywords.push_back(e.text);
        }
    }
    EXPECT_TRUE(saw_caption);
    EXPECT_TRUE(saw_country);
    ASSERT_EQ(keywords.size(), 2U);
    EXPECT_EQ(keywords[0], "a&b");
    EXPECT_EQ(keywords[1], "<c>");
}


TEST(IptcExportExpatTest, Latin1ValueParsesAsUnicodeText)
{
    // Record version, then city (2:90) = "S\xE3o!".
    const std::vector<std::byte> bytes = {
        std::byte { 0x1C }, std::byte { 0x02 }, std::byte { 0x00 },
        std::byte { 0x00 }, std::byte { 0x00 }, std::byte { 0x1C },
        std::byte { 0x02 }, std::byte { 0x5A }, std::byte { 0x00 },
        std::byte { 0x04 }, std::byte { 'S' },  std::byte { 0xE3 },
        std::byte { 'o' },  std::byte { '!' },
    };
    SpanByteSource source(bytes);
    IptcInfo info;
    ASSERT_EQ(read_iptc_info(source, &info).status, IptcReadStatus::Ok);

    std::string xml;
    ASSERT_EQ(export_iptc_xml(info, "", {}, &xml), IptcExportStatus::Ok);

    ParseContext ctx;
    ASSERT_TRUE(parse_xml(xml, &ctx)) << xml;
    bool saw_city = false;
    for (const ParsedElement& e : ctx.elements) {
        if (e.name == "city") {
            saw_city = true;
            // U+00E3 in UTF-8.
            EXPECT_EQ(e.text, "S\xC3\xA3o!");
        }
    }
    EXPECT_TRUE(saw_city);
}


TEST(IptcExportExpatTest, CollectionHasSingleRoot)
{
    IptcInfo a;
    a.set_scalar("city", "Oslo");
    IptcInfo b;
    b.set_scalar("city", "Bergen");
    const std::vector<IptcXmlEntry> entries = { { &a, {} }, { &b, {} } };

    std::string xml;
    ASSERT_EQ(export_iptc_xml_collection(entries, "", "", &xml),
              IptcExportStatus::Ok);

    ParseContext ctx;
    ASSERT_TRUE(parse_xml(xml, &ctx)) << xml;
    int roots  = 0;
    int photos = 0;
    for (const ParsedElement& e : ctx.elements) {
        roots += e.depth == 0 ? 1 : 0;
        photos += (e.name == "photo" && e.depth == 1) ? 1 : 0;
    }
    EXPECT_EQ(roots, 1);
    EXPECT_EQ(photos, 2);
}

}  // namespace iptcinfo
