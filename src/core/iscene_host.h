#pragma once

#include "anchor_types.h"

namespace xanchor {
namespace core {

// Visual representation of anchors in the host scene
class ISceneHost {
   public:
    virtual ~ISceneHost() = default;

    virtual void SpawnAnchorVisual(const AnchorRecord& record) = 0;
    virtual void UpdateAnchorVisual(const AnchorRecord& record) = 0;
    virtual void DestroyAnchorVisual(AnchorHandle handle) = 0;
};

}  // namespace core
}  // namespace xanchor
