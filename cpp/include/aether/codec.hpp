#pragma once

#include <string>
#include <string_view>

namespace aether::codec {

// encodeURIComponent: every byte except A-Z a-z 0-9 - _ . ! ~ * ' ( ) becomes %XX.
std::string PercentEncode(std::string_view input);

// Rejects truncated or non-hex escapes and escapes that decode to invalid UTF-8.
std::string PercentDecode(std::string_view input, bool* ok = nullptr);

bool IsValidUtf8(std::string_view input);

}  // namespace aether::codec
