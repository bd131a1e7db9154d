#pragma once

#include <cstddef>
#include <unordered_map>
#include <vector>

#include "anchor_types.h"

namespace xanchor {
namespace core {

// Live anchors in insertion order, indexed by handle. A handle is stored at most once.
class AnchorSet {
   public:
    // Returns false (and leaves the set unchanged) if the handle is already tracked
    bool Insert(const AnchorRecord& record);
    bool Erase(AnchorHandle handle);
    void Clear();

    bool Contains(AnchorHandle handle) const { return index_.find(handle) != index_.end(); }
    AnchorRecord* Find(AnchorHandle handle);
    const AnchorRecord* Find(AnchorHandle handle) const;

    size_t Size() const { return records_.size(); }
    bool Empty() const { return records_.empty(); }

    const std::vector<AnchorRecord>& Records() const { return records_; }

   private:
    std::vector<AnchorRecord> records_;
    std::unordered_map<AnchorHandle, size_t> index_;
};

}  // namespace core
}  // namespace xanchor
