#include "ignore_matcher.hpp"
#include "path_utils.hpp"
#include <fnmatch.h>
#include <fstream>
#include <memory>
#include <sstream>

namespace {
std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}
}

Result<IgnoreMatcher> IgnoreMatcher::load(const std::string& commaPatterns, const std::string& ignoreFile) {
    IgnoreMatcher matcher;

    std::stringstream list(commaPatterns);
    std::string item;
    while (std::getline(list, item, ',')) {
        matcher.addPattern(item);
    }

    if (!ignoreFile.empty()) {
        std::ifstream file(ignoreFile);
        if (!file) {
            return Result<IgnoreMatcher>::Error("failed to read ignore file " + ignoreFile, ErrorCode::Config);
        }
        std::string line;
        while (std::getline(file, line)) {
            matcher.addPattern(line);
        }
    }
    return Result<IgnoreMatcher>::Ok(matcher);
}

void IgnoreMatcher::addPattern(const std::string& line) {
    std::string pattern = trim(line);
    if (pattern.empty() || pattern[0] == '#') return;

    Rule rule;
    if (pattern[0] == '!') {
        rule.negate = true;
        pattern = pattern.substr(1);
    }
    if (!pattern.empty() && pattern.back() == '/') {
        rule.directoryOnly = true;
        while (!pattern.empty() && pattern.back() == '/') pattern.pop_back();
    }
    if (!pattern.empty() && pattern[0] == '/') {
        rule.hasSlash = true;
        pattern = pattern.substr(1);
    }
    if (pattern.empty()) return;
    if (pattern.find('/') != std::string::npos) rule.hasSlash = true;

    rule.glob = pattern;
    rules_.push_back(rule);
}

bool IgnoreMatcher::ruleMatches(const Rule& rule, const std::string& path, bool isDirectory) {
    if (rule.directoryOnly && !isDirectory) return false;

    if (!rule.hasSlash) {
        return fnmatch(rule.glob.c_str(), PathUtils::baseName(path).c_str(), 0) == 0;
    }

    if (rule.glob.find("**") != std::string::npos) {
        // '*' may cross directories; "**/x" also matches a top-level "x"
        if (fnmatch(rule.glob.c_str(), path.c_str(), 0) == 0) return true;
        if (rule.glob.rfind("**/", 0) == 0) {
            return fnmatch(rule.glob.c_str() + 3, path.c_str(), 0) == 0;
        }
        return false;
    }
    return fnmatch(rule.glob.c_str(), path.c_str(), FNM_PATHNAME) == 0;
}

int IgnoreMatcher::verdict(const std::string& path, bool isDirectory) const {
    int result = -1;
    for (const Rule& rule : rules_) {
        if (ruleMatches(rule, path, isDirectory)) {
            result = rule.negate ? 0 : 1;
        }
    }
    return result;
}

bool IgnoreMatcher::matches(const std::string& relativePath, bool isDirectory) const {
    if (rules_.empty()) return false;

    std::string path = PathUtils::toSlash(relativePath);
    while (!path.empty() && path[0] == '/') path = path.substr(1);

    // every enclosing directory first: an ignored parent hides its contents
    size_t slash = path.find('/');
    while (slash != std::string::npos) {
        if (verdict(path.substr(0, slash), true) == 1) return true;
        slash = path.find('/', slash + 1);
    }
    return verdict(path, isDirectory) == 1;
}

IgnorePredicate IgnoreMatcher::predicate() const {
    if (rules_.empty()) {
        return [](const std::string&) { return false; };
    }
    auto shared = std::make_shared<IgnoreMatcher>(*this);
    return [shared](const std::string& path) { return shared->matches(path); };
}
