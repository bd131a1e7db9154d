#pragma once

#include <openxr/openxr.h>

namespace xanchor {
namespace core {

// Input queries by OpenXR user path ("/user/hand/left") and component path ("/input/select/click").
// Both return false when the device or component is not available this frame.
class IGestureInput {
   public:
    virtual ~IGestureInput() = default;

    virtual bool GetInputStateBoolean(const char* user_path, const char* component_path, XrBool32& out_value) = 0;
    virtual bool GetDevicePosition(const char* user_path, XrVector3f& out_position) = 0;
};

}  // namespace core
}  // namespace xanchor
