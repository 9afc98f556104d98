#pragma once

#include "iptcinfo/iptc_info.h"

#include <cstdint>
#include <span>
#include <string>
#include <string_view>

/**
 * \file iptc_export.h
 * \brief XML and SQL renderings of decoded IPTC attributes.
 */

namespace iptcinfo {

enum class IptcExportStatus : uint8_t {
    Ok,
    /// A tag, table or column name is empty or not a plain identifier.
    InvalidArgument,
};

/// Caller-supplied key/value pair emitted ahead of the IPTC attributes.
struct IptcExportField final {
    std::string_view key;
    std::string_view value;
};

/// Maps an IPTC attribute name to a table column.
struct IptcSqlMapping final {
    std::string_view attribute;
    std::string_view column;
};

/// Default root element of \ref export_iptc_xml.
inline constexpr std::string_view kIptcXmlDefaultRoot = "photo";

/**
 * \brief Converts an attribute name into an XML element name.
 *
 * Spaces become `_` and slashes become `-`
 * (`"caption/abstract"` -> `"caption-abstract"`).
 */
std::string
iptc_xml_tag_name(std::string_view attribute);

/// Appends \p text with `& < > " '` escaped. Control bytes other than
/// tab/LF/CR are not representable in XML 1.0 and are dropped. Bytes
/// >= 0x80 are taken as Latin-1 and written as `&#xNN;` references, so the
/// output is plain ASCII and parses under the default UTF-8 encoding.
void
append_xml_escaped(std::string_view text, std::string* out);

/**
 * \brief Appends an XML document describing \p info into \p out.
 *
 * Layout (tab indented, one element per line):
 * - `<root>`; \p root_tag empty selects \ref kIptcXmlDefaultRoot
 * - one element per \p extra field, in the given order
 * - one element per scalar attribute, ordered by name
 * - `<keywords><keyword>..</keyword></keywords>` when keywords exist
 * - `<supplemental_categories><supplemental_category>..` likewise
 *
 * Returns InvalidArgument (and appends nothing) when \p root_tag or an
 * extra key is not a valid element name.
 */
IptcExportStatus
export_iptc_xml(const IptcInfo& info, std::string_view root_tag,
                std::span<const IptcExportField> extra, std::string* out);

/// Default wrapper element of \ref export_iptc_xml_collection.
inline constexpr std::string_view kIptcXmlDefaultCollection = "photos";

/// One image of a collection export.
struct IptcXmlEntry final {
    const IptcInfo* info = nullptr;
    std::span<const IptcExportField> extra;
};

/**
 * \brief Appends one XML document holding several images into \p out.
 *
 * Each entry is rendered as in \ref export_iptc_xml, indented one level
 * under a single `<collection_tag>` element (default
 * \ref kIptcXmlDefaultCollection). An empty \p entries yields an empty
 * collection element.
 *
 * Returns InvalidArgument (and appends nothing) when a tag or extra key is
 * not a valid element name, or an entry has no \p info.
 */
IptcExportStatus
export_iptc_xml_collection(std::span<const IptcXmlEntry> entries,
                           std::string_view collection_tag,
                           std::string_view root_tag, std::string* out);

/**
 * \brief Appends a single `INSERT INTO` statement into \p out.
 *
 * Extra fields come first, then \p mappings in order. Values are quoted with
 * `'` doubled. Attributes missing from \p info insert `''`; list attributes
 * insert their values joined with `", "`.
 *
 * Returns InvalidArgument (and appends nothing) when \p table is empty,
 * \p mappings is empty, or any identifier is not a plain SQL identifier.
 */
IptcExportStatus
export_iptc_sql(const IptcInfo& info, std::string_view table,
                std::span<const IptcSqlMapping> mappings,
                std::span<const IptcExportField> extra, std::string* out);

/// Writes \p text to \p path (truncating). Returns false on any I/O error.
bool
write_text_file(const char* path, std::string_view text) noexcept;

}  // namespace iptcinfo
