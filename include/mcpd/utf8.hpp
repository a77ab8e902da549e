#pragma once
#include <string>
#include <string_view>

namespace mcpd {

/// Copy of `in` with every ill-formed UTF-8 sequence replaced by U+FFFD.
/// Overlong forms, surrogates and code points above U+10FFFF count as
/// ill-formed; each maximal invalid subpart yields one replacement.
[[nodiscard]] std::string sanitize_utf8(std::string_view in);

} // namespace mcpd
