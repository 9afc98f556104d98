#pragma once

#include "iptcinfo/iptc_info.h"

#include <cstdint>
#include <string>
#include <string_view>

/**
 * \file console_format.h
 * \brief Terminal-safe renderings of decoded IPTC values.
 */

namespace iptcinfo {

/**
 * \brief Appends \p value as a double-quoted, ASCII-only string.
 *
 * - `\` and `"` are backslash-escaped; `\n`, `\r`, `\t` use C escapes
 * - other control bytes, DEL and bytes >= 0x80 become `\xNN`
 * - at most \p max_bytes input bytes are written (0 = unlimited), followed
 *   by `...` inside the quotes when truncated
 *
 * Returns true when anything other than `\` or `"` had to be escaped, or
 * the value was truncated.
 */
bool
append_console_quoted(std::string_view value, uint32_t max_bytes,
                      std::string* out) noexcept;

/**
 * \brief Appends one line per attribute of \p info into \p out.
 *
 * Scalars print as `name: "value"` ordered by name, then list values as
 * `name[i]: "value"` in stream order. Values go through
 * \ref append_console_quoted with \p max_bytes.
 */
void
append_iptc_text_report(const IptcInfo& info, uint32_t max_bytes,
                        std::string* out);

}  // namespace iptcinfo
