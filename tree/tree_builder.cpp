#include "tree_builder.hpp"
#include "../common/hash_utils.hpp"
#include "../common/log.hpp"
#include "../common/path_utils.hpp"
#include <filesystem>
#include <system_error>
#include <sys/stat.h>

namespace fs = std::filesystem;

Result<Tree> buildLocalTree(const std::string& root, const IgnorePredicate& ignore, bool computeHashes) {
    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
        return Result<Tree>::Error("not a directory: " + root, ErrorCode::Io);
    }

    Tree tree;
    fs::recursive_directory_iterator it(root, fs::directory_options::none, ec);
    if (ec) {
        return Result<Tree>::Error("cannot walk " + root + ": " + ec.message(), ErrorCode::Io);
    }

    for (fs::recursive_directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            return Result<Tree>::Error("cannot walk " + root + ": " + ec.message(), ErrorCode::Io);
        }
        const fs::directory_entry& entry = *it;
        std::string rel = PathUtils::toSlash(fs::relative(entry.path(), root, ec).generic_string());
        if (ec || rel.empty()) {
            return Result<Tree>::Error("cannot resolve " + entry.path().string(), ErrorCode::Io);
        }

        if (entry.is_directory(ec)) {
            if (ignore && ignore(rel + "/")) {
                it.disable_recursion_pending();
            }
            continue;
        }
        if (!entry.is_regular_file(ec)) continue;
        if (ignore && ignore(rel)) continue;

        FileRecord record;
        record.relativePath = rel;
        record.location = entry.path().string();

        struct stat st;
        if (::stat(record.location.c_str(), &st) != 0) {
            return Result<Tree>::Error("cannot stat " + record.location, ErrorCode::Io);
        }
        record.size = static_cast<uint64_t>(st.st_size);
        record.modTime = static_cast<int64_t>(st.st_mtime);

        if (computeHashes) {
            Result<std::string> hash = HashUtils::fileMd5Hex(record.location);
            if (!hash.success) return Result<Tree>::From(hash);
            record.contentHash = hash.data;
        }
        tree[rel] = record;
    }

    Log::verbose("Tree", "local " + root + ": " + std::to_string(tree.size()) + " files");
    return Result<Tree>::Ok(tree);
}

Result<Tree> buildRemoteTree(ObjectStore& store, const std::string& prefix, const IgnorePredicate& ignore) {
    Tree tree;
    std::string token;
    do {
        Result<ListPage> page = store.listPage(prefix, token);
        if (!page.success) return Result<Tree>::From(page, "list " + prefix);

        for (const ObjectInfo& object : page.data.objects) {
            std::string key = PathUtils::queryUnescape(object.key);
            if (key.compare(0, prefix.size(), prefix) != 0) continue;
            std::string rel = key.substr(prefix.size());
            while (!rel.empty() && rel.front() == '/') rel.erase(0, 1);
            if (rel.empty() || rel.back() == '/') continue;     // directory marker
            if (!PathUtils::isContainedRelative(rel)) {
                Log::warn("Tree", "skipping object " + key + ": path leaves the destination root");
                continue;
            }
            if (ignore && ignore(rel)) continue;

            FileRecord record;
            record.relativePath = rel;
            record.size = object.size;
            record.contentHash = object.etag;
            record.modTime = object.modTime;
            record.isRemote = true;
            record.location = key;
            tree[rel] = record;
        }
        token = page.data.truncated ? page.data.nextToken : "";
    } while (!token.empty());

    Log::verbose("Tree", "remote " + prefix + ": " + std::to_string(tree.size()) + " objects");
    return Result<Tree>::Ok(tree);
}
