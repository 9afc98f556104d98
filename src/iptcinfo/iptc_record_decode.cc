#include "iptcinfo/iptc_record_decode.h"

#include "iptcinfo/iim_marker_scan.h"

#include <array>
#include <string>
#include <utility>

namespace iptcinfo {
namespace {

    static uint8_t u8(std::byte b) noexcept
    {
        return static_cast<uint8_t>(b);
    }


    static bool read_value(ByteSource& source, uint16_t length,
                           std::string* out)
    {
        out->resize(length);
        if (length == 0U) {
            return true;
        }
        const std::span<std::byte> dst(reinterpret_cast<std::byte*>(
                                           out->data()),
                                       out->size());
        return source.read(dst) == dst.size();
    }

}  // namespace

bool
parse_iim_tag_header(std::span<const std::byte> bytes,
                     IimTagHeader* out) noexcept
{
    if (!out || bytes.size() < kIimTagHeaderSize) {
        return false;
    }
    out->marker  = u8(bytes[0]);
    out->record  = u8(bytes[1]);
    out->dataset = u8(bytes[2]);
    out->length  = static_cast<uint16_t>(
        (static_cast<uint16_t>(u8(bytes[3])) << 8)
        | static_cast<uint16_t>(u8(bytes[4])));
    return true;
}


IptcRecordDecodeResult
decode_iptc_records(ByteSource& source, const IptcDatasetRegistry& registry,
                    IptcInfo* out,
                    const IptcRecordDecodeOptions& options) noexcept
{
    IptcRecordDecodeResult result;
    if (!out) {
        return result;
    }
    if (!registry.valid()) {
        result.stop = IptcRecordStop::InvalidRegistry;
        return result;
    }

    const uint32_t max_datasets = options.limits.max_datasets;
    uint32_t consumed           = 0;
    std::string value;
    for (;;) {
        if (max_datasets != 0U && consumed >= max_datasets) {
            result.stop = IptcRecordStop::LimitExceeded;
            return result;
        }

        std::array<std::byte, kIimTagHeaderSize> raw {};
        if (source.read(raw) != raw.size()) {
            result.stop = IptcRecordStop::EndOfData;
            return result;
        }

        IimTagHeader header;
        (void)parse_iim_tag_header(raw, &header);
        if (header.marker != kIimMarker
            || header.record != kIimRecordApplication) {
            result.stop        = IptcRecordStop::EndOfRecord;
            result.last_header = header;
            return result;
        }
        consumed += 1;

        if (!read_value(source, header.length, &value)) {
            result.stop        = IptcRecordStop::TruncatedValue;
            result.last_header = header;
            return result;
        }

        const IptcDatasetInfo info = registry.classify(header.dataset);
        switch (info.kind) {
        case IptcDatasetKind::List:
            out->append_list(info.name, std::move(value));
            result.datasets_stored += 1;
            break;
        case IptcDatasetKind::Scalar:
            out->set_scalar(info.name, std::move(value));
            result.datasets_stored += 1;
            break;
        case IptcDatasetKind::Unsupported:
            result.datasets_discarded += 1;
            break;
        }
        value.clear();
    }
}


IptcRecordDecodeResult
decode_iptc_records(ByteSource& source, IptcInfo* out,
                    const IptcRecordDecodeOptions& options) noexcept
{
    return decode_iptc_records(source, IptcDatasetRegistry::standard(), out,
                               options);
}

}  // namespace iptcinfo
