#pragma once
#include "result.hpp"
#include <string>

struct S3Location {
    std::string bucket;
    std::string key;    // may be empty (bucket root)
};

namespace PathUtils {
    // backslashes become forward slashes
    std::string toSlash(std::string path);

    // decodes %XX escapes and '+' as space; returns the input unchanged when
    // it holds a malformed escape
    std::string queryUnescape(const std::string& value);

    // RFC 3986 encoding as required by AWS request signing
    std::string uriEncode(const std::string& value, bool encodeSlash);

    bool isS3Url(const std::string& path);

    // "s3://bucket/key/..." ; bucketOverride, when set, names the bucket and the
    // remaining text (minus a leading "bucket/") is the key
    Result<S3Location> parseS3Url(const std::string& url, const std::string& bucketOverride);

    // non-empty prefixes always end in '/'
    std::string directoryPrefix(const std::string& prefix);

    std::string baseName(const std::string& path);

    // a relative path that stays beneath whatever root it is joined to:
    // not absolute, no ".." segment, no empty or "." name
    bool isContainedRelative(const std::string& path);
}
