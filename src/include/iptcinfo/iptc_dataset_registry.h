#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>

/**
 * \file iptc_dataset_registry.h
 * \brief Static IPTC-IIM record 2 dataset id to attribute name tables.
 */

namespace iptcinfo {

/// How values of a record 2 dataset are stored by the decoder.
enum class IptcDatasetKind : uint8_t {
    /// Not in either table: value is discarded.
    Unsupported,
    /// Non-repeating attribute; the last occurrence wins.
    Scalar,
    /// Repeating attribute; every occurrence is kept in stream order.
    List,
};

/// One registry row.
struct IptcDatasetName final {
    uint8_t dataset = 0;
    std::string_view name;
};

/// Classification of a dataset id.
struct IptcDatasetInfo final {
    IptcDatasetKind kind = IptcDatasetKind::Unsupported;
    std::string_view name;
};

/// Result of checking registry tables.
enum class IptcDatasetRegistryStatus : uint8_t {
    Ok,
    /// A table is not sorted by strictly increasing dataset id.
    UnsortedTable,
    /// A row has an empty attribute name.
    EmptyName,
    /// The same dataset id appears in both tables.
    DuplicateDataset,
    /// The same attribute name appears more than once across both tables.
    DuplicateName,
};

/**
 * \brief Checks tables for use by \ref IptcDatasetRegistry.
 *
 * Lookups binary-search each table, and decoded scalars and lists must land
 * under disjoint names, so both tables must be sorted, non-empty named and
 * mutually disjoint in ids and names.
 */
IptcDatasetRegistryStatus
validate_iptc_dataset_tables(std::span<const IptcDatasetName> scalars,
                             std::span<const IptcDatasetName> lists) noexcept;

/**
 * \brief Immutable registry of supported record 2 datasets.
 *
 * Dataset 0 (record version) and 125 (rasterized caption) carry binary data
 * and are deliberately absent. A name belongs to exactly one table.
 */
class IptcDatasetRegistry final {
public:
    /// Returns the process-wide IIM v4 registry.
    static const IptcDatasetRegistry& standard() noexcept;

    /// Tables are checked with \ref validate_iptc_dataset_tables. An invalid
    /// registry answers every lookup as unsupported and is rejected by
    /// \ref decode_iptc_records.
    IptcDatasetRegistry(std::span<const IptcDatasetName> scalars,
                        std::span<const IptcDatasetName> lists) noexcept;

    IptcDatasetRegistryStatus status() const noexcept { return status_; }
    bool valid() const noexcept
    {
        return status_ == IptcDatasetRegistryStatus::Ok;
    }

    /// \return An empty view when \p dataset is not a scalar dataset.
    std::string_view scalar_name(uint8_t dataset) const noexcept;
    /// \return An empty view when \p dataset is not a list dataset.
    std::string_view list_name(uint8_t dataset) const noexcept;

    /// List table first, then scalar table.
    IptcDatasetInfo classify(uint8_t dataset) const noexcept;

    /// Reverse lookup by attribute name. Returns false when unknown.
    bool find_by_name(std::string_view name, uint8_t* dataset,
                      IptcDatasetKind* kind) const noexcept;

    std::span<const IptcDatasetName> scalars() const noexcept;
    std::span<const IptcDatasetName> lists() const noexcept;

private:
    std::span<const IptcDatasetName> scalars_;
    std::span<const IptcDatasetName> lists_;
    IptcDatasetRegistryStatus status_ = IptcDatasetRegistryStatus::Ok;
};

/// Attribute name of the keywords list (dataset 25).
inline constexpr std::string_view kIptcKeywords = "keywords";
/// Attribute name of the supplemental category list (dataset 20).
inline constexpr std::string_view kIptcSupplementalCategory
    = "supplemental category";

}  // namespace iptcinfo
