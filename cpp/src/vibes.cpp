#include "aether/vibes.hpp"

#include <stdexcept>
#include <utility>

namespace aether::vibes {

VibeTable::VibeTable(std::vector<Vibe> vibes) {
    for (auto& vibe : vibes) {
        if (vibe.key.empty()) {
            throw std::invalid_argument("Vibe key must not be empty");
        }
        std::string key = vibe.key;
        if (!vibes_.emplace(std::move(key), std::move(vibe)).second) {
            throw std::invalid_argument("Duplicate vibe key");
        }
    }
}

const Vibe* VibeTable::Find(std::string_view key) const {
    auto it = vibes_.find(key);
    return it == vibes_.end() ? nullptr : &it->second;
}

std::vector<std::string> VibeTable::Keys() const {
    std::vector<std::string> keys;
    keys.reserve(vibes_.size());
    for (const auto& entry : vibes_) {
        keys.push_back(entry.first);
    }
    return keys;
}

const VibeTable& DefaultVibes() {
    static const VibeTable table({
        {"default", "Default", ""},
        {"cyberpunk", "Cyberpunk", "vibe-cyberpunk"},
        {"sunset", "Sunset", "vibe-sunset"},
        {"matrix", "The Matrix", "vibe-matrix"},
        {"zen", "Zen Garden", "vibe-zen"},
    });
    return table;
}

}  // namespace aether::vibes
