#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <span>
#include <string>
#include <string_view>
#include <vector>

/**
 * \file iptc_info.h
 * \brief Decoded IPTC record 2 attributes.
 */

namespace iptcinfo {

/// Attribute name -> last decoded value.
using IptcScalarMap = std::map<std::string, std::string, std::less<>>;
/// Attribute name -> all decoded values in stream order.
using IptcListMap
    = std::map<std::string, std::vector<std::string>, std::less<>>;

/**
 * \brief Decoded IPTC-IIM record 2 attributes.
 *
 * Values are the raw dataset bytes held in `std::string` (usually ASCII or
 * Latin-1 text, but not guaranteed). The object owns its data and does not
 * refer back to the byte source it was decoded from.
 *
 * Scalar and list names come from disjoint registry tables, so a name is
 * stored in at most one of the two maps.
 */
class IptcInfo final {
public:
    /// Returns the scalar value for \p name, or nullptr when absent.
    const std::string* attribute(std::string_view name) const noexcept;
    /// Returns all values of list attribute \p name (empty when absent).
    std::span<const std::string> list(std::string_view name) const noexcept;

    std::span<const std::string> keywords() const noexcept;
    std::span<const std::string> supplemental_categories() const noexcept;

    const IptcScalarMap& scalars() const noexcept { return scalars_; }
    const IptcListMap& lists() const noexcept { return lists_; }

    bool empty() const noexcept;
    void clear() noexcept;

    /// Stores \p value under \p name, replacing any earlier value.
    void set_scalar(std::string_view name, std::string value);
    /// Appends \p value to list \p name.
    void append_list(std::string_view name, std::string value);

    friend bool operator==(const IptcInfo&, const IptcInfo&) = default;

private:
    IptcScalarMap scalars_;
    IptcListMap lists_;
};

}  // namespace iptcinfo
