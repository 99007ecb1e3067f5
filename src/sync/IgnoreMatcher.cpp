#include "sync/IgnoreMatcher.hpp"

using namespace stratus::sync;

const std::vector<std::string>& IgnoreMatcher::defaultPatterns() {
    static const std::vector<std::string> defaults{
        "~*",           // office lock files
        ".~lock.*",     // LibreOffice
        "~*.tmp",
        "*.swp",
        ".DS_Store",
        "Thumbs.db",
        "desktop.ini"
    };
    return defaults;
}

IgnoreMatcher::IgnoreMatcher() : IgnoreMatcher({}, true) {}

IgnoreMatcher::IgnoreMatcher(const std::vector<std::string>& patterns, const bool withDefaults) {
    if (withDefaults)
        for (const auto& p : defaultPatterns()) add(p);
    for (const auto& p : patterns) add(p);
}

void IgnoreMatcher::add(const std::string& pattern) {
    std::string p = pattern;

    while (!p.empty() && (p.back() == ' ' || p.back() == '\t' || p.back() == '\r')) p.pop_back();
    if (p.empty() || p.front() == '#') return;

    Rule rule;
    if (p.front() == '!') {
        rule.negate = true;
        p.erase(0, 1);
    } else if (p.starts_with("\\!") || p.starts_with("\\#")) {
        p.erase(0, 1);
    }

    if (!p.empty() && p.back() == '/') {
        rule.dirOnly = true;
        p.pop_back();
    }

    if (!p.empty() && p.front() == '/') {
        rule.anchored = true;
        p.erase(0, 1);
    } else if (p.find('/') != std::string::npos) {
        rule.anchored = true;
    }

    if (p.empty()) return;
    rule.glob = std::move(p);
    rules_.push_back(std::move(rule));
}

bool IgnoreMatcher::globMatch(const std::string_view pattern, const std::string_view text) {
    size_t p = 0, t = 0;
    while (p < pattern.size()) {
        const char c = pattern[p];

        if (c == '*') {
            const bool doubleStar = p + 1 < pattern.size() && pattern[p + 1] == '*';
            if (doubleStar) {
                p += 2;
                // "**/" also matches zero directories
                if (p < pattern.size() && pattern[p] == '/') {
                    if (globMatch(pattern.substr(p + 1), text.substr(t))) return true;
                }
                for (size_t i = t; i <= text.size(); ++i)
                    if (globMatch(pattern.substr(p), text.substr(i))) return true;
                return false;
            }

            ++p;
            for (size_t i = t; i <= text.size(); ++i) {
                if (globMatch(pattern.substr(p), text.substr(i))) return true;
                if (i < text.size() && text[i] == '/') break;
            }
            return false;
        }

        if (t >= text.size()) return false;

        if (c == '?') {
            if (text[t] == '/') return false;
        } else if (c == '\\' && p + 1 < pattern.size()) {
            ++p;
            if (pattern[p] != text[t]) return false;
        } else if (c != text[t]) {
            return false;
        }
        ++p;
        ++t;
    }
    return t == text.size();
}

bool IgnoreMatcher::matches(const Rule& rule, const std::vector<std::string>& parts, const bool isDir) {
    const size_t n = parts.size();

    if (rule.anchored) {
        std::string prefix;
        for (size_t k = 0; k < n; ++k) {
            if (k) prefix += '/';
            prefix += parts[k];
            const bool last = k + 1 == n;
            // An ignored directory hides everything beneath it.
            if (rule.dirOnly && last && !isDir) continue;
            if (globMatch(rule.glob, prefix)) return true;
        }
        return false;
    }

    for (size_t k = 0; k < n; ++k) {
        const bool last = k + 1 == n;
        if (rule.dirOnly && last && !isDir) continue;
        if (globMatch(rule.glob, parts[k])) return true;
    }
    return false;
}

bool IgnoreMatcher::isIgnored(const std::filesystem::path& path, const bool isDir) const {
    std::vector<std::string> parts;
    for (const auto& part : path.lexically_normal().relative_path()) {
        const auto s = part.generic_string();
        if (s.empty() || s == ".") continue;
        parts.push_back(s);
    }
    if (parts.empty()) return false;

    bool ignored = false;
    for (const auto& rule : rules_)
        if (matches(rule, parts, isDir)) ignored = !rule.negate;
    return ignored;
}
