#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "aether/acoustic.hpp"
#include "aether/constants.hpp"
#include "aether/errors.hpp"
#include "aether/link.hpp"
#include "aether/locator.hpp"
#include "aether/transport.hpp"

namespace aether {

struct InspectResult {
    std::string kind;
    header::FileHeader header;
    bool locked = false;
    std::size_t payload_len = 0;
    std::optional<std::string> peer;
};

// Summarises a link without unlocking it.
InspectResult InspectLink(const std::string& text);

// A password argument naming a readable file is replaced by the file's
// contents (one trailing newline stripped); "~/" expands to $HOME.
std::string ResolvePassword(const std::string& input);

// "@path" reads the locator or share URL from a file, "-" from stdin.
std::string ResolveLocatorArgument(const std::string& input);

}  // namespace aether
