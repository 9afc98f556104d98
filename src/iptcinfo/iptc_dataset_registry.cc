#include "iptcinfo/iptc_dataset_registry.h"

namespace iptcinfo {
namespace {

    // IIM v4, record 2. Sorted by dataset id.
    static constexpr IptcDatasetName kScalarDatasets[] = {
        { 5, "object name" },
        { 7, "edit status" },
        { 8, "editorial update" },
        { 10, "urgency" },
        { 12, "subject reference" },
        { 15, "category" },
        { 22, "fixture identifier" },
        { 26, "content location code" },
        { 27, "content location name" },
        { 30, "release date" },
        { 35, "release time" },
        { 37, "expiration date" },
        { 38, "expiration time" },
        { 40, "special instructions" },
        { 42, "action advised" },
        { 45, "reference service" },
        { 47, "reference date" },
        { 50, "reference number" },
        { 55, "date created" },
        { 60, "time created" },
        { 62, "digital creation date" },
        { 63, "digital creation time" },
        { 65, "originating program" },
        { 70, "program version" },
        { 75, "object cycle" },
        { 80, "by-line" },
        { 85, "by-line title" },
        { 90, "city" },
        { 92, "sub-location" },
        { 95, "province/state" },
        { 100, "country/primary location code" },
        { 101, "country/primary location name" },
        { 103, "original transmission reference" },
        { 105, "headline" },
        { 110, "credit" },
        { 115, "source" },
        { 116, "copyright notice" },
        { 118, "contact" },
        { 120, "caption/abstract" },
        { 122, "writer/editor" },
        { 130, "image type" },
        { 131, "image orientation" },
        { 135, "language identifier" },
    };

    static constexpr IptcDatasetName kListDatasets[] = {
        { 20, kIptcSupplementalCategory },
        { 25, kIptcKeywords },
    };

    static std::string_view find_name(std::span<const IptcDatasetName> table,
                                      uint8_t dataset) noexcept
    {
        size_t lo = 0;
        size_t hi = table.size();
        while (lo < hi) {
            const size_t mid  = lo + (hi - lo) / 2;
            const uint8_t cur = table[mid].dataset;
            if (cur < dataset) {
                lo = mid + 1;
            } else {
                hi = mid;
            }
        }
        if (lo < table.size() && table[lo].dataset == dataset) {
            return table[lo].name;
        }
        return {};
    }


    static const IptcDatasetName*
    find_row(std::span<const IptcDatasetName> table,
             std::string_view name) noexcept
    {
        for (size_t i = 0; i < table.size(); ++i) {
            if (table[i].name == name) {
                return &table[i];
            }
        }
        return nullptr;
    }


    static bool
    sorted_by_dataset(std::span<const IptcDatasetName> table) noexcept
    {
        for (size_t i = 1; i < table.size(); ++i) {
            if (table[i - 1].dataset >= table[i].dataset) {
                return false;
            }
        }
        return true;
    }


    static bool
    has_empty_name(std::span<const IptcDatasetName> table) noexcept
    {
        for (size_t i = 0; i < table.size(); ++i) {
            if (table[i].name.empty()) {
                return true;
            }
        }
        return false;
    }


    // Counts rows of `table` named `name`.
    static size_t name_count(std::span<const IptcDatasetName> table,
                             std::string_view name) noexcept
    {
        size_t n = 0;
        for (size_t i = 0; i < table.size(); ++i) {
            n += table[i].name == name ? 1U : 0U;
        }
        return n;
    }

}  // namespace

IptcDatasetRegistryStatus
validate_iptc_dataset_tables(std::span<const IptcDatasetName> scalars,
                             std::span<const IptcDatasetName> lists) noexcept
{
    if (!sorted_by_dataset(scalars) || !sorted_by_dataset(lists)) {
        return IptcDatasetRegistryStatus::UnsortedTable;
    }
    if (has_empty_name(scalars) || has_empty_name(lists)) {
        return IptcDatasetRegistryStatus::EmptyName;
    }
    for (size_t i = 0; i < lists.size(); ++i) {
        if (!find_name(scalars, lists[i].dataset).empty()) {
            return IptcDatasetRegistryStatus::DuplicateDataset;
        }
    }
    for (size_t i = 0; i < scalars.size(); ++i) {
        if (name_count(scalars, scalars[i].name)
                + name_count(lists, scalars[i].name)
            != 1U) {
            return IptcDatasetRegistryStatus::DuplicateName;
        }
    }
    for (size_t i = 0; i < lists.size(); ++i) {
        if (name_count(lists, lists[i].name) != 1U) {
            return IptcDatasetRegistryStatus::DuplicateName;
        }
    }
    return IptcDatasetRegistryStatus::Ok;
}


const IptcDatasetRegistry&
IptcDatasetRegistry::standard() noexcept
{
    static const IptcDatasetRegistry kStandard(kScalarDatasets, kListDatasets);
    return kStandard;
}


IptcDatasetRegistry::IptcDatasetRegistry(
    std::span<const IptcDatasetName> scalars,
    std::span<const IptcDatasetName> lists) noexcept
    : status_(validate_iptc_dataset_tables(scalars, lists))
{
    if (status_ == IptcDatasetRegistryStatus::Ok) {
        scalars_ = scalars;
        lists_   = lists;
    }
}


std::string_view
IptcDatasetRegistry::scalar_name(uint8_t dataset) const noexcept
{
    return find_name(scalars_, dataset);
}


std::string_view
IptcDatasetRegistry::list_name(uint8_t dataset) const noexcept
{
    return find_name(lists_, dataset);
}


IptcDatasetInfo
IptcDatasetRegistry::classify(uint8_t dataset) const noexcept
{
    IptcDatasetInfo info;
    info.name = find_name(lists_, dataset);
    if (!info.name.empty()) {
        info.kind = IptcDatasetKind::List;
        return info;
    }
    info.name = find_name(scalars_, dataset);
    if (!info.name.empty()) {
        info.kind = IptcDatasetKind::Scalar;
    }
    return info;
}


bool
IptcDatasetRegistry::find_by_name(std::string_view name, uint8_t* dataset,
                                  IptcDatasetKind* kind) const noexcept
{
    const IptcDatasetName* row = find_row(lists_, name);
    IptcDatasetKind found      = IptcDatasetKind::List;
    if (!row) {
        row   = find_row(scalars_, name);
        found = IptcDatasetKind::Scalar;
    }
    if (!row) {
        return false;
    }
    if (dataset) {
        *dataset = row->dataset;
    }
    if (kind) {
        *kind = found;
    }
    return true;
}


std::span<const IptcDatasetName>
IptcDatasetRegistry::scalars() const noexcept
{
    return scalars_;
}


std::span<const IptcDatasetName>
IptcDatasetRegistry::lists() const noexcept
{
    return lists_;
}

}  // namespace iptcinfo
