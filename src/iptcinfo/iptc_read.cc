#include "iptcinfo/iptc_read.h"

namespace iptcinfo {

IptcReadResult
read_iptc_info(ByteSource& source, const IptcDatasetRegistry& registry,
               IptcInfo* out, const IptcReadOptions& options) noexcept
{
    IptcReadResult result;
    if (!out) {
        return result;
    }
    out->clear();
    if (!registry.valid()) {
        result.status      = IptcReadStatus::InvalidRegistry;
        result.decode.stop = IptcRecordStop::InvalidRegistry;
        return result;
    }

    const IimScanResult scan = scan_iim_marker(source, options.scan);
    if (scan.status != IimScanStatus::Found) {
        return result;
    }

    result.status = IptcReadStatus::Ok;
    result.offset = scan.offset;
    result.decode = decode_iptc_records(source, registry, out, options.decode);
    return result;
}


IptcReadResult
read_iptc_info(ByteSource& source, IptcInfo* out,
               const IptcReadOptions& options) noexcept
{
    return read_iptc_info(source, IptcDatasetRegistry::standard(), out,
                          options);
}

}  // namespace iptcinfo
