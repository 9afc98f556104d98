#include "iptcinfo/iptc_export.h"

#include <cstdio>

namespace iptcinfo {
namespace {

    static bool is_ascii_alpha(char c) noexcept
    {
        return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
    }


    static bool is_ascii_digit(char c) noexcept
    {
        return c >= '0' && c <= '9';
    }


    static bool is_xml_name(std::string_view s) noexcept
    {
        if (s.empty()) {
            return false;
        }
        if (!is_ascii_alpha(s[0]) && s[0] != '_') {
            return false;
        }
        for (size_t i = 1; i < s.size(); ++i) {
            const char c  = s[i];
            const bool ok = is_ascii_alpha(c) || is_ascii_digit(c) || c == '_'
                            || c == '-' || c == '.';
            if (!ok) {
                return false;
            }
        }
        return true;
    }


    // `name` or `schema.name`.
    static bool is_sql_identifier(std::string_view s) noexcept
    {
        if (s.empty()) {
            return false;
        }
        bool at_start = true;
        for (size_t i = 0; i < s.size(); ++i) {
            const char c = s[i];
            if (c == '.') {
                if (at_start) {
                    return false;
                }
                at_start = true;
                continue;
            }
            if (at_start) {
                if (!is_ascii_alpha(c) && c != '_') {
                    return false;
                }
                at_start = false;
                continue;
            }
            if (!is_ascii_alpha(c) && !is_ascii_digit(c) && c != '_') {
                return false;
            }
        }
        return !at_start;
    }


    static void append_element(std::string_view indent, std::string_view tag,
                               std::string_view text, std::string* out)
    {
        out->append(indent);
        out->push_back('<');
        out->append(tag);
        out->push_back('>');
        append_xml_escaped(text, out);
        out->append("</");
        out->append(tag);
        out->append(">\n");
    }


    static void append_list_element(std::string_view indent,
                                    std::string_view outer,
                                    std::string_view inner,
                                    std::span<const std::string> values,
                                    std::string* out)
    {
        if (values.empty()) {
            return;
        }
        std::string inner_indent(indent);
        inner_indent.push_back('\t');

        out->append(indent);
        out->push_back('<');
        out->append(outer);
        out->append(">\n");
        for (size_t i = 0; i < values.size(); ++i) {
            append_element(inner_indent, inner, values[i], out);
        }
        out->append(indent);
        out->append("</");
        out->append(outer);
        out->append(">\n");
    }


    static bool extra_keys_valid(std::span<const IptcExportField> extra)
    {
        for (size_t i = 0; i < extra.size(); ++i) {
            if (!is_xml_name(extra[i].key)) {
                return false;
            }
        }
        return true;
    }


    // One `<root>` element whose start tag is indented by `depth` tabs.
    static void append_photo(const IptcInfo& info, std::string_view root,
                             std::span<const IptcExportField> extra,
                             uint32_t depth, std::string* out)
    {
        const std::string indent(depth, '\t');
        const std::string child(depth + 1U, '\t');

        out->append(indent);
        out->push_back('<');
        out->append(root);
        out->append(">\n");

        for (size_t i = 0; i < extra.size(); ++i) {
            append_element(child, extra[i].key, extra[i].value, out);
        }
        for (const auto& [name, value] : info.scalars()) {
            append_element(child, iptc_xml_tag_name(name), value, out);
        }
        append_list_element(child, "keywords", "keyword", info.keywords(),
                            out);
        append_list_element(child, "supplemental_categories",
                            "supplemental_category",
                            info.supplemental_categories(), out);

        out->append(indent);
        out->append("</");
        out->append(root);
        out->append(">\n");
    }


    static void append_sql_quoted(std::string_view value, std::string* out)
    {
        out->push_back('\'');
        for (size_t i = 0; i < value.size(); ++i) {
            if (value[i] == '\'') {
                out->push_back('\'');
            }
            out->push_back(value[i]);
        }
        out->push_back('\'');
    }


    static std::string sql_attribute_value(const IptcInfo& info,
                                           std::string_view attribute)
    {
        const std::string* scalar = info.attribute(attribute);
        if (scalar) {
            return *scalar;
        }
        const std::span<const std::string> values = info.list(attribute);
        std::string joined;
        for (size_t i = 0; i < values.size(); ++i) {
            if (i != 0U) {
                joined.append(", ");
            }
            joined.append(values[i]);
        }
        return joined;
    }

}  // namespace

std::string
iptc_xml_tag_name(std::string_view attribute)
{
    std::string tag(attribute);
    for (size_t i = 0; i < tag.size(); ++i) {
        if (tag[i] == ' ') {
            tag[i] = '_';
        } else if (tag[i] == '/') {
            tag[i] = '-';
        }
    }
    return tag;
}


void
append_xml_escaped(std::string_view text, std::string* out)
{
    out->reserve(out->size() + text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        const char c = text[i];
        switch (c) {
        case '&': out->append("&amp;"); break;
        case '<': out->append("&lt;"); break;
        case '>': out->append("&gt;"); break;
        case '"': out->append("&quot;"); break;
        case '\'': out->append("&apos;"); break;
        case '\t':
        case '\n':
        case '\r': out->push_back(c); break;
        default: {
            const unsigned char u = static_cast<unsigned char>(c);
            if (u < 0x20U) {
                break;
            }
            if (u >= 0x80U) {
                // Latin-1: the byte value is the code point.
                char buf[8];
                std::snprintf(buf, sizeof(buf), "&#x%02X;",
                              static_cast<unsigned>(u));
                out->append(buf);
                break;
            }
            out->push_back(c);
            break;
        }
        }
    }
}


IptcExportStatus
export_iptc_xml(const IptcInfo& info, std::string_view root_tag,
                std::span<const IptcExportField> extra, std::string* out)
{
    if (!out) {
        return IptcExportStatus::InvalidArgument;
    }
    const std::string_view root = root_tag.empty() ? kIptcXmlDefaultRoot
                                                   : root_tag;
    if (!is_xml_name(root) || !extra_keys_valid(extra)) {
        return IptcExportStatus::InvalidArgument;
    }
    append_photo(info, root, extra, 0, out);
    return IptcExportStatus::Ok;
}


IptcExportStatus
export_iptc_xml_collection(std::span<const IptcXmlEntry> entries,
                           std::string_view collection_tag,
                           std::string_view root_tag, std::string* out)
{
    if (!out) {
        return IptcExportStatus::InvalidArgument;
    }
    const std::string_view collection = collection_tag.empty()
                                            ? kIptcXmlDefaultCollection
                                            : collection_tag;
    const std::string_view root = root_tag.empty() ? kIptcXmlDefaultRoot
                                                   : root_tag;
    if (!is_xml_name(collection) || !is_xml_name(root)) {
        return IptcExportStatus::InvalidArgument;
    }
    for (size_t i = 0; i < entries.size(); ++i) {
        if (!entries[i].info || !extra_keys_valid(entries[i].extra)) {
            return IptcExportStatus::InvalidArgument;
        }
    }

    out->push_back('<');
    out->append(collection);
    out->append(">\n");
    for (size_t i = 0; i < entries.size(); ++i) {
        append_photo(*entries[i].info, root, entries[i].extra, 1, out);
    }
    out->append("</");
    out->append(collection);
    out->append(">\n");
    return IptcExportStatus::Ok;
}


IptcExportStatus
export_iptc_sql(const IptcInfo& info, std::string_view table,
                std::span<const IptcSqlMapping> mappings,
                std::span<const IptcExportField> extra, std::string* out)
{
    if (!out || mappings.empty() || !is_sql_identifier(table)) {
        return IptcExportStatus::InvalidArgument;
    }
    for (size_t i = 0; i < extra.size(); ++i) {
        if (!is_sql_identifier(extra[i].key)) {
            return IptcExportStatus::InvalidArgument;
        }
    }
    for (size_t i = 0; i < mappings.size(); ++i) {
        if (!is_sql_identifier(mappings[i].column)) {
            return IptcExportStatus::InvalidArgument;
        }
    }

    std::string columns;
    std::string values;
    for (size_t i = 0; i < extra.size(); ++i) {
        if (!columns.empty()) {
            columns.append(", ");
            values.append(", ");
        }
        columns.append(extra[i].key);
        append_sql_quoted(extra[i].value, &values);
    }
    for (size_t i = 0; i < mappings.size(); ++i) {
        if (!columns.empty()) {
            columns.append(", ");
            values.append(", ");
        }
        columns.append(mappings[i].column);
        append_sql_quoted(sql_attribute_value(info, mappings[i].attribute),
                          &values);
    }

    out->append("INSERT INTO ");
    out->append(table);
    out->append(" (");
    out->append(columns);
    out->append(") VALUES (");
    out->append(values);
    out->push_back(')');
    return IptcExportStatus::Ok;
}


bool
write_text_file(const char* path, std::string_view text) noexcept
{
    if (!path || !*path) {
        return false;
    }
    std::FILE* f = std::fopen(path, "wb");
    if (!f) {
        return false;
    }
    const size_t written = text.empty()
                               ? 0
                               : std::fwrite(text.data(), 1, text.size(), f);
    const bool closed = std::fclose(f) == 0;
    return closed && written == text.size();
}

}  // namespace iptcinfo
