#include "iptcinfo/iptc_info.h"

#include "iptcinfo/iptc_dataset_registry.h"

#include <utility>

namespace iptcinfo {

const std::string*
IptcInfo::attribute(std::string_view name) const noexcept
{
    const auto it = scalars_.find(name);
    if (it == scalars_.end()) {
        return nullptr;
    }
    return &it->second;
}


std::span<const std::string>
IptcInfo::list(std::string_view name) const noexcept
{
    const auto it = lists_.find(name);
    if (it == lists_.end()) {
        return {};
    }
    return std::span<const std::string>(it->second.data(), it->second.size());
}


std::span<const std::string>
IptcInfo::keywords() const noexcept
{
    return list(kIptcKeywords);
}


std::span<const std::string>
IptcInfo::supplemental_categories() const noexcept
{
    return list(kIptcSupplementalCategory);
}


bool
IptcInfo::empty() const noexcept
{
    return scalars_.empty() && lists_.empty();
}


void
IptcInfo::clear() noexcept
{
    scalars_.clear();
    lists_.clear();
}


void
IptcInfo::set_scalar(std::string_view name, std::string value)
{
    const auto it = scalars_.find(name);
    if (it != scalars_.end()) {
        it->second = std::move(value);
        return;
    }
    scalars_.emplace(std::string(name), std::move(value));
}


void
IptcInfo::append_list(std::string_view name, std::string value)
{
    auto it = lists_.find(name);
    if (it == lists_.end()) {
        it = lists_.emplace(std::string(name), std::vector<std::string> {})
                 .first;
    }
    it->second.push_back(std::move(value));
}

}  // namespace iptcinfo
