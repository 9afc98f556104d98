#include "iptcinfo/iptc_read.h"

#include "fuzztest/fuzztest.h"
#include "gtest/gtest.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace iptcinfo {

struct Dataset final {
    uint8_t dataset = 0;
    std::string value;
};

static void
append_tag(std::vector<std::byte>* out, uint8_t dataset,
           const std::string& value)
{
    const uint16_t len = static_cast<uint16_t>(value.size());
    out->push_back(std::byte { 0x1C });
    out->push_back(std::byte { 0x02 });
    out->push_back(std::byte { dataset });
    out->push_back(static_cast<std::byte>(len >> 8));
    out->push_back(static_cast<std::byte>(len & 0xFFU));
    for (char c : value) {
        out->push_back(static_cast<std::byte>(c));
    }
}


// A well-formed block after an arbitrary preamble decodes exactly the
// registry-routed datasets: last scalar wins, lists keep order.
static void
well_formed_block_decodes_all_datasets(const std::vector<uint8_t>& preamble,
                                       const std::vector<Dataset>& datasets)
{
    std::vector<std::byte> bytes;
    for (uint8_t b : preamble) {
        // Keep the preamble free of markers so the block offset is known.
        bytes.push_back(std::byte { static_cast<uint8_t>(b == 0x1C ? 0 : b) });
    }
    const uint64_t block_offset = bytes.size();
    append_tag(&bytes, 0, std::string("\x00\x04", 2));

    IptcInfo expected;
    const IptcDatasetRegistry& registry = IptcDatasetRegistry::standard();
    for (const Dataset& d : datasets) {
        append_tag(&bytes, d.dataset, d.value);
        const IptcDatasetInfo info = registry.classify(d.dataset);
        if (info.kind == IptcDatasetKind::List) {
            expected.append_list(info.name, d.value);
        } else if (info.kind == IptcDatasetKind::Scalar) {
            expected.set_scalar(info.name, d.value);
        }
    }

    SpanByteSource source(bytes);
    IptcInfo info;
    const IptcReadResult r = read_iptc_info(source, &info);
    ASSERT_EQ(r.status, IptcReadStatus::Ok);
    ASSERT_EQ(r.offset, block_offset);
    ASSERT_EQ(r.decode.stop, IptcRecordStop::EndOfData);
    ASSERT_EQ(info, expected);
}


FUZZ_TEST(IptcReadFuzz, well_formed_block_decodes_all_datasets)
    .WithDomains(
        fuzztest::VectorOf(fuzztest::Arbitrary<uint8_t>()).WithMaxSize(400),
        fuzztest::VectorOf(
            fuzztest::StructOf<Dataset>(
                fuzztest::Arbitrary<uint8_t>(),
                fuzztest::String().WithMaxSize(64)))
            .WithMaxSize(32));

}  // namespace iptcinfo
