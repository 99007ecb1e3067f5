#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace stratus::sync {

// gitignore-style path filter. The last matching rule wins; '!' rules re-include.
class IgnoreMatcher {
public:
    static const std::vector<std::string>& defaultPatterns();

    IgnoreMatcher();
    explicit IgnoreMatcher(const std::vector<std::string>& patterns, bool withDefaults = true);

    void add(const std::string& pattern);

    // path is relative to the sync root.
    [[nodiscard]] bool isIgnored(const std::filesystem::path& path, bool isDir = false) const;

    [[nodiscard]] size_t size() const { return rules_.size(); }

    // '*' and '?' stop at '/', '**' crosses it.
    static bool globMatch(std::string_view pattern, std::string_view text);

private:
    struct Rule {
        std::string glob;
        bool negate = false;
        bool dirOnly = false;
        bool anchored = false;
    };

    std::vector<Rule> rules_;

    static bool matches(const Rule& rule, const std::vector<std::string>& parts, bool isDir);
};

}
