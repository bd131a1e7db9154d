#include <gtest/gtest.h>
#include <openxr/openxr.h>

#include <cmath>

#include "../../src/core/pose_math.h"

using xanchor::core::Distance;
using xanchor::core::LookRotation;
using xanchor::core::MakePose;
using xanchor::core::Rotate;

static const XrVector3f kUp{0.0f, 1.0f, 0.0f};

static float QuaternionLength(const XrQuaternionf& q) {
    return std::sqrt(q.x * q.x + q.y * q.y + q.z * q.z + q.w * q.w);
}

static void ExpectVectorNear(const XrVector3f& actual, const XrVector3f& expected) {
    EXPECT_NEAR(actual.x, expected.x, 1e-4f);
    EXPECT_NEAR(actual.y, expected.y, 1e-4f);
    EXPECT_NEAR(actual.z, expected.z, 1e-4f);
}

TEST(PoseMathTest, Distance_ThreeFourFive_ReturnsFive) {
    EXPECT_FLOAT_EQ(Distance(XrVector3f{1.0f, 1.0f, 0.0f}, XrVector3f{4.0f, 5.0f, 0.0f}), 5.0f);
    EXPECT_FLOAT_EQ(Distance(XrVector3f{2.0f, -1.0f, 3.0f}, XrVector3f{2.0f, -1.0f, 3.0f}), 0.0f);
}

TEST(PoseMathTest, LookRotation_NegativeZ_ReturnsIdentity) {
    XrQuaternionf q = LookRotation(XrVector3f{0.0f, 0.0f, -3.0f}, kUp);

    EXPECT_NEAR(std::fabs(q.w), 1.0f, 1e-5f);
    EXPECT_NEAR(q.x, 0.0f, 1e-5f);
    EXPECT_NEAR(q.y, 0.0f, 1e-5f);
    EXPECT_NEAR(q.z, 0.0f, 1e-5f);
}

TEST(PoseMathTest, LookRotation_Diagonal_ForwardAxisFollowsDirection) {
    XrVector3f forward{1.0f, 0.5f, 2.0f};
    XrQuaternionf q = LookRotation(forward, kUp);

    float length = std::sqrt(1.0f + 0.25f + 4.0f);
    ExpectVectorNear(Rotate(q, XrVector3f{0.0f, 0.0f, -1.0f}),
                     XrVector3f{forward.x / length, forward.y / length, forward.z / length});
    EXPECT_NEAR(QuaternionLength(q), 1.0f, 1e-5f);

    // Roll stays level: the rotated X axis has no vertical component
    EXPECT_NEAR(Rotate(q, XrVector3f{1.0f, 0.0f, 0.0f}).y, 0.0f, 1e-4f);
}

TEST(PoseMathTest, LookRotation_ZeroForward_ReturnsIdentity) {
    XrQuaternionf q = LookRotation(XrVector3f{0.0f, 0.0f, 0.0f}, kUp);

    EXPECT_FLOAT_EQ(q.x, 0.0f);
    EXPECT_FLOAT_EQ(q.y, 0.0f);
    EXPECT_FLOAT_EQ(q.z, 0.0f);
    EXPECT_FLOAT_EQ(q.w, 1.0f);
}

TEST(PoseMathTest, LookRotation_ParallelToUp_StillValid) {
    XrQuaternionf up = LookRotation(XrVector3f{0.0f, 2.0f, 0.0f}, kUp);
    XrQuaternionf down = LookRotation(XrVector3f{0.0f, -1.0f, 0.0f}, kUp);

    EXPECT_FALSE(std::isnan(up.w));
    EXPECT_FALSE(std::isnan(down.w));
    EXPECT_NEAR(QuaternionLength(up), 1.0f, 1e-5f);
    ExpectVectorNear(Rotate(up, XrVector3f{0.0f, 0.0f, -1.0f}), XrVector3f{0.0f, 1.0f, 0.0f});
    ExpectVectorNear(Rotate(down, XrVector3f{0.0f, 0.0f, -1.0f}), XrVector3f{0.0f, -1.0f, 0.0f});
}

TEST(PoseMathTest, Rotate_Identity_ReturnsInput) {
    XrVector3f v{0.3f, -2.0f, 7.5f};
    ExpectVectorNear(Rotate(XrQuaternionf{0.0f, 0.0f, 0.0f, 1.0f}, v), v);
}

TEST(PoseMathTest, MakePose_CopiesPositionAndOrientation) {
    XrPosef pose = MakePose(XrVector3f{1.0f, 2.0f, 3.0f}, XrQuaternionf{0.0f, 1.0f, 0.0f, 0.0f});

    EXPECT_FLOAT_EQ(pose.position.x, 1.0f);
    EXPECT_FLOAT_EQ(pose.position.z, 3.0f);
    EXPECT_FLOAT_EQ(pose.orientation.y, 1.0f);
    EXPECT_FLOAT_EQ(pose.orientation.w, 0.0f);
}
