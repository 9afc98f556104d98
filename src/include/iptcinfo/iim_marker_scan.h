#pragma once

#include "iptcinfo/byte_source.h"

#include <cstddef>
#include <cstdint>
#include <span>

/**
 * \file iim_marker_scan.h
 * \brief Locates the first IPTC-IIM record 2 block near the start of a file.
 */

namespace iptcinfo {

/// IIM tag marker byte.
inline constexpr uint8_t kIimMarker = 0x1C;
/// Application record number.
inline constexpr uint8_t kIimRecordApplication = 2;
/// Record version dataset; always the first record 2 dataset.
inline constexpr uint8_t kIimDatasetRecordVersion = 0;
/// Default scan window: offsets 0..512 inclusive.
inline constexpr uint32_t kIimDefaultMaxPrefixBytes = 512;

enum class IimScanStatus : uint8_t {
    Found,
    /// No `1C 02 00` header starts within the scan window.
    NotFound,
};

struct IimScanOptions final {
    /// Last offset (inclusive) at which a marker may start.
    uint32_t max_prefix_bytes = kIimDefaultMaxPrefixBytes;
};

struct IimScanResult final {
    IimScanStatus status = IimScanStatus::NotFound;
    /// Offset of the qualifying `0x1C` byte (valid when status is Found).
    uint64_t offset = 0;
};

/**
 * \brief Scans \p source from offset 0 for the record 2 / dataset 0 header.
 *
 * On success the cursor of \p source is left at the returned offset. After a
 * `0x1C` that is not followed by `02 00`, scanning resumes one byte past the
 * false marker, so lookahead bytes are examined again.
 *
 * Never fails: an exhausted or unseekable source yields NotFound.
 */
IimScanResult
scan_iim_marker(ByteSource& source,
                const IimScanOptions& options = IimScanOptions {}) noexcept;

/// Convenience overload for in-memory bytes.
IimScanResult
scan_iim_marker(std::span<const std::byte> bytes,
                const IimScanOptions& options = IimScanOptions {}) noexcept;

}  // namespace iptcinfo
