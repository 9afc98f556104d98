#include "iptcinfo/iim_marker_scan.h"

namespace iptcinfo {
namespace {

    static bool read_u8(ByteSource& source, uint8_t* out) noexcept
    {
        std::byte b {};
        if (source.read(std::span<std::byte>(&b, 1)) != 1) {
            return false;
        }
        *out = static_cast<uint8_t>(b);
        return true;
    }

}  // namespace

IimScanResult
scan_iim_marker(ByteSource& source, const IimScanOptions& options) noexcept
{
    IimScanResult result;

    if (!source.seek(0)) {
        return result;
    }

    const uint64_t max_offset = options.max_prefix_bytes;
    for (uint64_t offset = 0; offset <= max_offset; ++offset) {
        uint8_t c = 0;
        if (!read_u8(source, &c)) {
            return result;
        }
        if (c != kIimMarker) {
            continue;
        }

        uint8_t record  = 0;
        uint8_t dataset = 0;
        const bool have_record  = read_u8(source, &record);
        const bool have_dataset = have_record && read_u8(source, &dataset);
        if (have_dataset && record == kIimRecordApplication
            && dataset == kIimDatasetRecordVersion) {
            if (!source.seek(offset)) {
                return result;
            }
            result.status = IimScanStatus::Found;
            result.offset = offset;
            return result;
        }

        // Rewind over the lookahead: it may hold the real marker.
        if (!source.seek(offset + 1)) {
            return result;
        }
    }
    return result;
}


IimScanResult
scan_iim_marker(std::span<const std::byte> bytes,
                const IimScanOptions& options) noexcept
{
    SpanByteSource source(bytes);
    return scan_iim_marker(source, options);
}

}  // namespace iptcinfo
