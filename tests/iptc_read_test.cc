#include "iptcinfo/iptc_read.h"

#include <gtest/gtest.h>

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <initializer_list>
#include <string>
#include <string_view>
#include <vector>

namespace iptcinfo {
namespace {

    static void append_raw(std::vector<std::byte>* out,
                           std::initializer_list<uint8_t> bytes)
    {
        for (uint8_t b : bytes) {
            out->push_back(std::byte { b });
        }
    }


    static void append_text(std::vector<std::byte>* out, std::string_view s)
    {
        for (char c : s) {
            out->push_back(static_cast<std::byte>(c));
        }
    }


    // 50 bytes of binary preamble, the version tag, caption "cat", then a
    // record 7 tag.
    static std::vector<std::byte> make_scenario_bytes()
    {
        std::vector<std::byte> bytes;
        for (uint32_t i = 0; i < 50; ++i) {
            bytes.push_back(static_cast<std::byte>((i * 37U + 11U) & 0xFFU));
        }
        append_raw(&bytes, { 0x1C, 0x02, 0x00, 0x00, 0x00 });
        append_raw(&bytes, { 0x1C, 0x02, 0x78, 0x00, 0x03 });
        append_text(&bytes, "cat");
        append_raw(&bytes, { 0x1C, 0x07, 0x0A, 0x00, 0x02 });
        append_text(&bytes, "zz");
        return bytes;
    }

}  // namespace

TEST(IptcReadTest, DecodesBlockAfterBinaryPreamble)
{
    const std::vector<std::byte> bytes = make_scenario_bytes();

    const IimScanResult scan = scan_iim_marker(bytes);
    ASSERT_EQ(scan.status, IimScanStatus::Found);
    EXPECT_EQ(scan.offset, 50U);

    SpanByteSource source(bytes);
    IptcInfo info;
    const IptcReadResult r = read_iptc_info(source, &info);
    ASSERT_EQ(r.status, IptcReadStatus::Ok);
    EXPECT_EQ(r.offset, 50U);
    EXPECT_EQ(r.decode.stop, IptcRecordStop::EndOfRecord);
    EXPECT_EQ(r.decode.last_header.record, 7U);
    EXPECT_EQ(r.decode.datasets_stored, 1U);

    ASSERT_NE(info.attribute("caption/abstract"), nullptr);
    EXPECT_EQ(*info.attribute("caption/abstract"), "cat");
    EXPECT_EQ(info.scalars().size(), 1U);
    EXPECT_TRUE(info.lists().empty());
}


TEST(IptcReadTest, ReportsNotFoundAndClearsOutput)
{
    const std::vector<std::byte> bytes(2048, std::byte { 0x1C });

    IptcInfo info;
    info.set_scalar("city", "stale");

    SpanByteSource source(bytes);
    const IptcReadResult r = read_iptc_info(source, &info);
    EXPECT_EQ(r.status, IptcReadStatus::NotFound);
    EXPECT_TRUE(info.empty());
}


TEST(IptcReadTest, HonorsScanWindowOption)
{
    std::vector<std::byte> bytes(1000, std::byte { 0x00 });
    append_raw(&bytes, { 0x1C, 0x02, 0x00, 0x00, 0x00 });
    append_raw(&bytes, { 0x1C, 0x02, 0x5A, 0x00, 0x04 });
    append_text(&bytes, "Rome");

    SpanByteSource source(bytes);
    IptcInfo info;
    EXPECT_EQ(read_iptc_info(source, &info).status, IptcReadStatus::NotFound);

    IptcReadOptions options;
    options.scan.max_prefix_bytes = 1000;
    const IptcReadResult r        = read_iptc_info(source, &info, options);
    ASSERT_EQ(r.status, IptcReadStatus::Ok);
    EXPECT_EQ(r.offset, 1000U);
    ASSERT_NE(info.attribute("city"), nullptr);
    EXPECT_EQ(*info.attribute("city"), "Rome");
}


TEST(IptcReadTest, ReadsFromFile)
{
    const std::vector<std::byte> bytes = make_scenario_bytes();
    const std::string path = ::testing::TempDir() + "iptcinfo_read_test.jpg";
    {
        std::FILE* f = std::fopen(path.c_str(), "wb");
        ASSERT_NE(f, nullptr);
        ASSERT_EQ(std::fwrite(bytes.data(), 1, bytes.size(), f), bytes.size());
        ASSERT_EQ(std::fclose(f), 0);
    }

    FileByteSource source;
    ASSERT_EQ(source.open(path.c_str()), FileOpenStatus::Ok);
    IptcInfo info;
    const IptcReadResult r = read_iptc_info(source, &info);
    source.close();
    (void)std::remove(path.c_str());

    ASSERT_EQ(r.status, IptcReadStatus::Ok);
    EXPECT_EQ(r.offset, 50U);
    ASSERT_NE(info.attribute("caption/abstract"), nullptr);
    EXPECT_EQ(*info.attribute("caption/abstract"), "cat");
}


TEST(IptcReadTest, ResultOutlivesSource)
{
    IptcInfo info;
    {
        std::vector<std::byte> bytes = make_scenario_bytes();
        SpanByteSource source(bytes);
        ASSERT_EQ(read_iptc_info(source, &info).status, IptcReadStatus::Ok);
        bytes.assign(bytes.size(), std::byte { 0 });
    }
    ASSERT_NE(info.attribute("caption/abstract"), nullptr);
    EXPECT_EQ(*info.attribute("caption/abstract"), "cat");
}


TEST(IptcReadTest, RejectsInvalidRegistryWithoutReading)
{
    static constexpr IptcDatasetName kScalars[] = {
        { 120, "caption" },
    };
    static constexpr IptcDatasetName kLists[] = {
        { 25, "caption" },
    };
    const IptcDatasetRegistry registry(kScalars, kLists);

    const std::vector<std::byte> bytes = make_scenario_bytes();
    SpanByteSource source(bytes);
    IptcInfo info;
    info.set_scalar("stale", "x");
    const IptcReadResult r = read_iptc_info(source, registry, &info);
    EXPECT_EQ(r.status, IptcReadStatus::InvalidRegistry);
    EXPECT_EQ(r.decode.stop, IptcRecordStop::InvalidRegistry);
    EXPECT_TRUE(info.empty());
    EXPECT_EQ(source.tell(), 0U);
}

}  // namespace iptcinfo
