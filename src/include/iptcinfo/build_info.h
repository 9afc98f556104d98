#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

/**
 * \file build_info.h
 * \brief What the linked IptcInfo library was built as, and its defaults.
 */

namespace iptcinfo {

struct BuildInfo final {
    /// Library version string (e.g. "1.1.0").
    std::string_view version;
    /// e.g. "Release", "Debug", "multi-config"; empty when unset.
    std::string_view build_type;
    /// "static" or "shared".
    std::string_view linkage;
    /// `<compiler id> <compiler version>`.
    std::string_view compiler;
    /// `<system>/<processor>`.
    std::string_view target;
    /// ISO-8601 UTC, or empty.
    std::string_view build_timestamp_utc;

    /// Default \ref IimScanOptions::max_prefix_bytes.
    uint32_t default_max_prefix_bytes = 0;
    /// Default \ref IptcRecordDecodeLimits::max_datasets.
    uint32_t default_max_datasets = 0;
    /// Sizes of the tables behind \ref IptcDatasetRegistry::standard.
    size_t scalar_datasets = 0;
    size_t list_datasets   = 0;
};

/// Returns build information for the linked library.
const BuildInfo&
build_info() noexcept;

/**
 * \brief Replaces \p out with a three-line, newline-terminated summary.
 *
 * ```
 * IptcInfo 1.1.0 (Release, static)
 * GNU 13.2.0 for Linux/x86_64, built 2026-01-01T00:00:00Z
 * record 2: 43 scalar + 2 list datasets, scan window 512, max datasets 200000
 * ```
 * An empty build type prints as `unknown`; an empty timestamp drops the
 * `, built ...` part.
 */
void
format_build_info(const BuildInfo& info, std::string* out);

}  // namespace iptcinfo
