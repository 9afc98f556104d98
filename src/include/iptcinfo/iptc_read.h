#pragma once

#include "iptcinfo/iim_marker_scan.h"
#include "iptcinfo/iptc_info.h"
#include "iptcinfo/iptc_record_decode.h"

#include <cstdint>

/**
 * \file iptc_read.h
 * \brief One-call IPTC extraction: marker scan followed by record decode.
 */

namespace iptcinfo {

enum class IptcReadStatus : uint8_t {
    Ok,
    /// No IPTC record 2 block in the scan window.
    NotFound,
    /// The dataset registry is invalid; the source was not read.
    InvalidRegistry,
};

struct IptcReadOptions final {
    IimScanOptions scan;
    IptcRecordDecodeOptions decode;
};

struct IptcReadResult final {
    IptcReadStatus status = IptcReadStatus::NotFound;
    /// Offset of the first record 2 header (valid when status is Ok).
    uint64_t offset = 0;
    IptcRecordDecodeResult decode;
};

/**
 * \brief Reads IPTC record 2 attributes from \p source into \p out.
 *
 * \p out is cleared first. A truncated or interrupted block still returns Ok
 * with whatever was decoded; see \ref IptcReadResult::decode for the reason
 * decoding ended.
 */
IptcReadResult
read_iptc_info(ByteSource& source, IptcInfo* out,
               const IptcReadOptions& options = IptcReadOptions {}) noexcept;

/// Variant with an explicit dataset registry.
IptcReadResult
read_iptc_info(ByteSource& source, const IptcDatasetRegistry& registry,
               IptcInfo* out,
               const IptcReadOptions& options = IptcReadOptions {}) noexcept;

}  // namespace iptcinfo
