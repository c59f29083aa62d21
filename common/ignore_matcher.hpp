#pragma once
#include "result.hpp"
#include <functional>
#include <string>
#include <vector>

// shouldIgnore(relativePath) -> bool, consulted by every tree walk and listing
using IgnorePredicate = std::function<bool(const std::string&)>;

// gitignore-style rules: '#' comments, '!' negation (last match wins),
// trailing '/' for directories only, leading '/' anchors to the root,
// patterns without '/' match any path component, '**' spans directories.
// A path beneath an ignored directory is ignored.
class IgnoreMatcher {
public:
    IgnoreMatcher() = default;

    // patterns from a comma-separated list and/or a file, one per line
    static Result<IgnoreMatcher> load(const std::string& commaPatterns, const std::string& ignoreFile);

    void addPattern(const std::string& line);
    bool empty() const { return rules_.empty(); }

    bool matches(const std::string& relativePath, bool isDirectory = false) const;

    IgnorePredicate predicate() const;

private:
    struct Rule {
        std::string glob;
        bool negate = false;
        bool directoryOnly = false;
        bool hasSlash = false;
    };

    // -1 no rule matched, 0 re-included, 1 ignored
    int verdict(const std::string& path, bool isDirectory) const;
    static bool ruleMatches(const Rule& rule, const std::string& path, bool isDirectory);

    std::vector<Rule> rules_;
};
