#pragma once
#include "../common/byte_stream.hpp"
#include "../common/result.hpp"
#include <cstdint>
#include <map>
#include <string>
#include <vector>

using ObjectMetadata = std::map<std::string, std::string>;

struct ObjectInfo {
    std::string key;         // as listed; may still be URL-encoded
    uint64_t size = 0;
    int64_t modTime = 0;     // unix seconds, 0 when unknown
    std::string etag;        // surrounding quotes removed
};

struct ListPage {
    std::vector<ObjectInfo> objects;
    bool truncated = false;
    std::string nextToken;
};

struct ObjectHead {
    bool exists = false;
    uint64_t size = 0;
    int64_t modTime = 0;
    std::string etag;
    ObjectMetadata metadata;   // user metadata without the x-amz-meta- prefix
};

// The slice of an S3-style store the mirror needs. Implementations must be
// safe to call from many worker threads at once.
class ObjectStore {
public:
    virtual ~ObjectStore() = default;

    // one page of keys under prefix; pass the previous page's nextToken to continue
    virtual Result<ListPage> listPage(const std::string& prefix, const std::string& continuationToken) = 0;

    // a missing key is exists=false, not an error
    virtual Result<ObjectHead> head(const std::string& key) = 0;

    virtual Result<void> get(const std::string& key, ByteSink& sink) = 0;

    // size is the exact number of bytes body will yield; the object becomes
    // visible at key only if the whole body was stored
    virtual Result<void> put(const std::string& key, ByteSource& body, uint64_t size,
                             const ObjectMetadata& metadata) = 0;

    virtual Result<void> remove(const std::string& key) = 0;
};
