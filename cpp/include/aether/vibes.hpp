#pragma once

#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace aether::vibes {

struct Vibe {
    std::string key;
    std::string name;
    std::string css_class;
};

// Theme keys are opaque to the pipeline; this table only validates and labels them.
class VibeTable {
public:
    explicit VibeTable(std::vector<Vibe> vibes);

    const Vibe* Find(std::string_view key) const;
    bool Contains(std::string_view key) const { return Find(key) != nullptr; }
    std::vector<std::string> Keys() const;

private:
    std::map<std::string, Vibe, std::less<>> vibes_;
};

// Built once on first use; never mutated afterwards.
const VibeTable& DefaultVibes();

inline constexpr std::string_view kDefaultVibe = "default";

}  // namespace aether::vibes
