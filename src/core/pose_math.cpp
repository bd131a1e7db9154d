#include "pose_math.h"

#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>

namespace xanchor {
namespace core {

static constexpr float kEpsilon = 1e-6f;

static glm::vec3 ToGlm(const XrVector3f& v) { return glm::vec3(v.x, v.y, v.z); }

static XrVector3f FromGlm(const glm::vec3& v) { return XrVector3f{v.x, v.y, v.z}; }

// glm::quat is constructed (w, x, y, z)
static glm::quat ToGlm(const XrQuaternionf& q) { return glm::quat(q.w, q.x, q.y, q.z); }

static XrQuaternionf FromGlm(const glm::quat& q) { return XrQuaternionf{q.x, q.y, q.z, q.w}; }

float Distance(const XrVector3f& a, const XrVector3f& b) { return glm::distance(ToGlm(a), ToGlm(b)); }

XrQuaternionf LookRotation(const XrVector3f& forward, const XrVector3f& up) {
    glm::vec3 direction = ToGlm(forward);
    float length = glm::length(direction);
    if (length < kEpsilon) {
        return XrQuaternionf{0.0f, 0.0f, 0.0f, 1.0f};
    }
    direction /= length;

    glm::vec3 up_axis = ToGlm(up);
    if (glm::length(glm::cross(direction, up_axis)) < kEpsilon) {
        // Looking straight up or down
        up_axis = glm::vec3(0.0f, 0.0f, 1.0f);
        if (glm::length(glm::cross(direction, up_axis)) < kEpsilon) {
            up_axis = glm::vec3(1.0f, 0.0f, 0.0f);
        }
    }

    return FromGlm(glm::normalize(glm::quatLookAtRH(direction, up_axis)));
}

XrVector3f Rotate(const XrQuaternionf& q, const XrVector3f& v) { return FromGlm(ToGlm(q) * ToGlm(v)); }

XrPosef MakePose(const XrVector3f& position, const XrQuaternionf& orientation) {
    XrPosef pose;
    pose.orientation = orientation;
    pose.position = position;
    return pose;
}

}  // namespace core
}  // namespace xanchor
