#include "path_utils.hpp"
#include <algorithm>
#include <cctype>

namespace PathUtils {

std::string toSlash(std::string path) {
    std::replace(path.begin(), path.end(), '\\', '/');
    return path;
}

namespace {
int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}
}

std::string queryUnescape(const std::string& value) {
    std::string out;
    out.reserve(value.size());
    for (size_t i = 0; i < value.size(); ++i) {
        char c = value[i];
        if (c == '+') {
            out += ' ';
        } else if (c == '%') {
            if (i + 2 >= value.size()) return value;
            int hi = hexValue(value[i + 1]);
            int lo = hexValue(value[i + 2]);
            if (hi < 0 || lo < 0) return value;
            out += static_cast<char>((hi << 4) | lo);
            i += 2;
        } else {
            out += c;
        }
    }
    return out;
}

std::string uriEncode(const std::string& value, bool encodeSlash) {
    static const char* hex = "0123456789ABCDEF";
    std::string out;
    out.reserve(value.size() * 3);
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out += static_cast<char>(c);
        } else if (c == '/' && !encodeSlash) {
            out += '/';
        } else {
            out += '%';
            out += hex[(c >> 4) & 0xF];
            out += hex[c & 0xF];
        }
    }
    return out;
}

bool isS3Url(const std::string& path) {
    return path.rfind("s3://", 0) == 0;
}

Result<S3Location> parseS3Url(const std::string& url, const std::string& bucketOverride) {
    std::string rest = isS3Url(url) ? url.substr(5) : url;
    S3Location location;

    if (!bucketOverride.empty()) {
        location.bucket = bucketOverride;
        std::string lead = bucketOverride + "/";
        if (rest == bucketOverride) {
            rest.clear();
        } else if (rest.rfind(lead, 0) == 0) {
            rest = rest.substr(lead.size());
        }
        location.key = rest;
        return Result<S3Location>::Ok(location);
    }

    size_t slash = rest.find('/');
    location.bucket = rest.substr(0, slash);
    if (slash != std::string::npos) {
        location.key = rest.substr(slash + 1);
    }
    if (location.bucket.empty()) {
        return Result<S3Location>::Error("invalid S3 location '" + url +
                                         "', use s3://bucket/key or pass --bucket", ErrorCode::Config);
    }
    return Result<S3Location>::Ok(location);
}

std::string directoryPrefix(const std::string& prefix) {
    if (prefix.empty() || prefix.back() == '/') return prefix;
    return prefix + "/";
}

std::string baseName(const std::string& path) {
    std::string p = toSlash(path);
    while (p.size() > 1 && p.back() == '/') p.pop_back();
    size_t slash = p.rfind('/');
    return slash == std::string::npos ? p : p.substr(slash + 1);
}

bool isContainedRelative(const std::string& path) {
    std::string p = toSlash(path);
    if (p.empty() || p[0] == '/') return false;
    size_t start = 0;
    while (true) {
        size_t slash = p.find('/', start);
        std::string segment = p.substr(start, slash == std::string::npos ? std::string::npos : slash - start);
        if (segment == "..") return false;
        if (slash == std::string::npos) return !segment.empty() && segment != ".";
        start = slash + 1;
    }
}

}
