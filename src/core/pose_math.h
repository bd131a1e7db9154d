#pragma once

#include <openxr/openxr.h>

namespace xanchor {
namespace core {

float Distance(const XrVector3f& a, const XrVector3f& b);

// Right-handed look rotation: the rotated -Z axis points along forward.
// Identity for a zero-length forward; an alternate up axis is used when forward is parallel to up.
XrQuaternionf LookRotation(const XrVector3f& forward, const XrVector3f& up);

XrVector3f Rotate(const XrQuaternionf& q, const XrVector3f& v);

XrPosef MakePose(const XrVector3f& position, const XrQuaternionf& orientation);

}  // namespace core
}  // namespace xanchor
