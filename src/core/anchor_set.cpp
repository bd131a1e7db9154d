#include "anchor_set.h"

namespace xanchor {
namespace core {

bool AnchorSet::Insert(const AnchorRecord& record) {
    if (record.handle == XA_NULL_ANCHOR || Contains(record.handle)) {
        return false;
    }
    index_[record.handle] = records_.size();
    records_.push_back(record);
    return true;
}

bool AnchorSet::Erase(AnchorHandle handle) {
    auto it = index_.find(handle);
    if (it == index_.end()) {
        return false;
    }

    size_t index = it->second;
    index_.erase(it);
    records_.erase(records_.begin() + index);

    // Shift the indices of everything after the erased slot to keep insertion order
    for (size_t i = index; i < records_.size(); i++) {
        index_[records_[i].handle] = i;
    }
    return true;
}

void AnchorSet::Clear() {
    records_.clear();
    index_.clear();
}

AnchorRecord* AnchorSet::Find(AnchorHandle handle) {
    auto it = index_.find(handle);
    if (it == index_.end()) {
        return nullptr;
    }
    return &records_[it->second];
}

const AnchorRecord* AnchorSet::Find(AnchorHandle handle) const {
    auto it = index_.find(handle);
    if (it == index_.end()) {
        return nullptr;
    }
    return &records_[it->second];
}

}  // namespace core
}  // namespace xanchor
