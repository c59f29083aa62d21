#pragma once
#include "../common/result.hpp"
#include "../tree/tree_builder.hpp"
#include <functional>
#include <vector>

struct DiffPlan {
    std::vector<FileRecord> toTransfer;   // drawn from the source tree
    std::vector<FileRecord> toDelete;     // drawn from the destination tree
    size_t unchangedCount = 0;

    bool empty() const { return toTransfer.empty() && toDelete.empty(); }
};

// (sourceRecord, destinationRecord) -> true when the two hold the same content
using SameContent = std::function<Result<bool>(const FileRecord&, const FileRecord&)>;

// Source is authoritative: anything missing or different at the destination
// is transferred, anything only at the destination is deleted.
Result<DiffPlan> computeDiff(const Tree& source, const Tree& destination, const SameContent& same);
