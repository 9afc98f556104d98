#pragma once

#include "iptcinfo/byte_source.h"
#include "iptcinfo/iptc_dataset_registry.h"
#include "iptcinfo/iptc_info.h"

#include <cstddef>
#include <cstdint>
#include <span>

/**
 * \file iptc_record_decode.h
 * \brief Sequential decoder for IPTC-IIM record 2 datasets.
 */

namespace iptcinfo {

/// Size of a standard (16-bit length) IIM tag header.
inline constexpr uint32_t kIimTagHeaderSize = 5;

/// One IIM tag header as laid out on the wire.
struct IimTagHeader final {
    uint8_t marker  = 0;
    uint8_t record  = 0;
    uint8_t dataset = 0;
    /// Big-endian on the wire. Extended lengths are not interpreted.
    uint16_t length = 0;
};

/**
 * \brief Why decoding stopped.
 *
 * Apart from InvalidRegistry none of these is an error for the caller:
 * everything decoded before the stop point is kept.
 */
enum class IptcRecordStop : uint8_t {
    /// Fewer than 5 bytes were left for the next header.
    EndOfData,
    /// The next header is not a `0x1C` record 2 tag.
    EndOfRecord,
    /// The source ended inside a value; that dataset was dropped.
    TruncatedValue,
    /// \ref IptcRecordDecodeLimits::max_datasets was reached.
    LimitExceeded,
    /// The registry failed \ref validate_iptc_dataset_tables; nothing was
    /// read.
    InvalidRegistry,
};

/// Resource limits applied during decode to bound hostile inputs.
struct IptcRecordDecodeLimits final {
    /// Maximum headers consumed (0 = unlimited).
    uint32_t max_datasets = 200000;
};

struct IptcRecordDecodeOptions final {
    IptcRecordDecodeLimits limits;
};

struct IptcRecordDecodeResult final {
    IptcRecordStop stop = IptcRecordStop::EndOfData;
    /// Datasets stored as scalar or list values.
    uint32_t datasets_stored = 0;
    /// Complete datasets whose id is not in the registry.
    uint32_t datasets_discarded = 0;
    /// Header of the tag that ended decoding (EndOfRecord/TruncatedValue).
    IimTagHeader last_header;
};

/// Parses a 5-byte tag header. Returns false when \p bytes is too short.
bool
parse_iim_tag_header(std::span<const std::byte> bytes,
                     IimTagHeader* out) noexcept;

/**
 * \brief Decodes record 2 datasets from the cursor of \p source into \p out.
 *
 * \p source is expected to be positioned at the offset returned by
 * \ref scan_iim_marker. Each dataset is routed through \p registry: list
 * datasets are appended, scalar datasets overwrite, unknown ids are dropped.
 * Decoding ends at the first header that is short, not a marker, or not
 * record 2, or at a value shorter than its declared length.
 */
IptcRecordDecodeResult
decode_iptc_records(ByteSource& source, const IptcDatasetRegistry& registry,
                    IptcInfo* out,
                    const IptcRecordDecodeOptions& options
                    = IptcRecordDecodeOptions {}) noexcept;

/// Same as above, using \ref IptcDatasetRegistry::standard.
IptcRecordDecodeResult
decode_iptc_records(ByteSource& source, IptcInfo* out,
                    const IptcRecordDecodeOptions& options
                    = IptcRecordDecodeOptions {}) noexcept;

}  // namespace iptcinfo
