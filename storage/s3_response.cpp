#include "s3_response.hpp"
#include <cstdio>
#include <cstdlib>
#include <ctime>

namespace {
void appendUtf8(std::string& out, unsigned long code) {
    if (code < 0x80) {
        out += static_cast<char>(code);
    } else if (code < 0x800) {
        out += static_cast<char>(0xC0 | (code >> 6));
        out += static_cast<char>(0x80 | (code & 0x3F));
    } else if (code < 0x10000) {
        out += static_cast<char>(0xE0 | (code >> 12));
        out += static_cast<char>(0x80 | ((code >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (code & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (code >> 18));
        out += static_cast<char>(0x80 | ((code >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((code >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (code & 0x3F));
    }
}

// "#65" or "#x41"; false for anything that is not a valid code point
bool parseCharReference(const std::string& entity, unsigned long& code) {
    bool hex = entity.size() > 1 && (entity[1] == 'x' || entity[1] == 'X');
    const char* digits = entity.c_str() + (hex ? 2 : 1);
    if (*digits == '\0') return false;
    char* end = nullptr;
    code = std::strtoul(digits, &end, hex ? 16 : 10);
    if (end == nullptr || *end != '\0') return false;
    if (code == 0 || code > 0x10FFFF) return false;
    return code < 0xD800 || code > 0xDFFF;
}
}

std::string stripQuotes(const std::string& s) {
    std::string out = s;
    if (out.size() >= 2 && out.front() == '"' && out.back() == '"') out = out.substr(1, out.size() - 2);
    return out;
}

std::string xmlUnescape(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] != '&') {
            out += s[i];
            continue;
        }
        size_t semi = s.find(';', i);
        if (semi == std::string::npos) {
            out += s[i];
            continue;
        }
        std::string entity = s.substr(i + 1, semi - i - 1);
        unsigned long code = 0;
        if (entity == "amp") out += '&';
        else if (entity == "lt") out += '<';
        else if (entity == "gt") out += '>';
        else if (entity == "quot") out += '"';
        else if (entity == "apos") out += '\'';
        else if (!entity.empty() && entity[0] == '#' && parseCharReference(entity, code)) appendUtf8(out, code);
        else out += s.substr(i, semi - i + 1);
        i = semi;
    }
    return out;
}

std::vector<std::string> xmlElements(const std::string& xml, const std::string& tag) {
    std::vector<std::string> out;
    const std::string open = "<" + tag + ">";
    const std::string close = "</" + tag + ">";
    size_t pos = 0;
    while ((pos = xml.find(open, pos)) != std::string::npos) {
        size_t start = pos + open.size();
        size_t end = xml.find(close, start);
        if (end == std::string::npos) break;
        out.push_back(xml.substr(start, end - start));
        pos = end + close.size();
    }
    return out;
}

std::string xmlElement(const std::string& xml, const std::string& tag) {
    std::vector<std::string> all = xmlElements(xml, tag);
    return all.empty() ? "" : xmlUnescape(all.front());
}

int64_t parseIso8601(const std::string& text) {
    std::tm tm{};
    if (std::sscanf(text.c_str(), "%d-%d-%dT%d:%d:%d", &tm.tm_year, &tm.tm_mon, &tm.tm_mday,
                    &tm.tm_hour, &tm.tm_min, &tm.tm_sec) != 6) {
        return 0;
    }
    tm.tm_year -= 1900;
    tm.tm_mon -= 1;
    return static_cast<int64_t>(timegm(&tm));
}

int64_t parseHttpDate(const std::string& text) {
    std::tm tm{};
    if (strptime(text.c_str(), "%a, %d %b %Y %H:%M:%S", &tm) == nullptr) return 0;
    return static_cast<int64_t>(timegm(&tm));
}

Result<ListPage> parseListObjects(const std::string& xml) {
    ListPage page;
    for (const std::string& entry : xmlElements(xml, "Contents")) {
        ObjectInfo object;
        object.key = xmlElement(entry, "Key");
        object.size = std::strtoull(xmlElement(entry, "Size").c_str(), nullptr, 10);
        object.modTime = parseIso8601(xmlElement(entry, "LastModified"));
        object.etag = stripQuotes(xmlElement(entry, "ETag"));
        if (!object.key.empty()) page.objects.push_back(object);
    }
    page.truncated = xmlElement(xml, "IsTruncated") == "true";
    page.nextToken = xmlElement(xml, "NextContinuationToken");
    if (page.truncated && page.nextToken.empty()) {
        return Result<ListPage>::Error("list objects: truncated page without continuation token", ErrorCode::Remote);
    }
    return Result<ListPage>::Ok(page);
}
