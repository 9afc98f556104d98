#include "iptcinfo/console_format.h"

#include <cstdio>

namespace iptcinfo {
namespace {

    // C escape for `c`, or nullptr when `c` prints as itself.
    static const char* short_escape(unsigned char c) noexcept
    {
        switch (c) {
        case '\\': return "\\\\";
        case '"': return "\\\"";
        case '\n': return "\\n";
        case '\r': return "\\r";
        case '\t': return "\\t";
        default: return nullptr;
        }
    }

}  // namespace

bool
append_console_quoted(std::string_view value, uint32_t max_bytes,
                      std::string* out) noexcept
{
    const size_t n = (max_bytes == 0U || value.size() < max_bytes)
                         ? value.size()
                         : static_cast<size_t>(max_bytes);
    bool escaped = false;

    out->reserve(out->size() + n + 2U);
    out->push_back('"');
    for (size_t i = 0; i < n; ++i) {
        const unsigned char c = static_cast<unsigned char>(value[i]);
        const char* esc       = short_escape(c);
        if (esc) {
            out->append(esc);
            escaped = escaped || (c != '\\' && c != '"');
            continue;
        }
        if (c < 0x20U || c == 0x7FU || c >= 0x80U) {
            char buf[8];
            std::snprintf(buf, sizeof(buf), "\\x%02X",
                          static_cast<unsigned>(c));
            out->append(buf);
            escaped = true;
            continue;
        }
        out->push_back(static_cast<char>(c));
    }
    if (n < value.size()) {
        out->append("...");
        escaped = true;
    }
    out->push_back('"');
    return escaped;
}


void
append_iptc_text_report(const IptcInfo& info, uint32_t max_bytes,
                        std::string* out)
{
    for (const auto& [name, value] : info.scalars()) {
        out->append(name);
        out->append(": ");
        (void)append_console_quoted(value, max_bytes, out);
        out->push_back('\n');
    }
    for (const auto& [name, values] : info.lists()) {
        for (size_t i = 0; i < values.size(); ++i) {
            out->append(name);
            out->push_back('[');
            out->append(std::to_string(i));
            out->append("]: ");
            (void)append_console_quoted(values[i], max_bytes, out);
            out->push_back('\n');
        }
    }
}

}  // namespace iptcinfo
