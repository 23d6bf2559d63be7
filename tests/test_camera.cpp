#include "vrc_camera.h"

#include <cmath>
#include <gtest/gtest.h>

namespace {
constexpr float kEps = 1e-4f;
}

TEST(CameraMath, IdentityIsNeutralForMul) {
    const vrc::float4x4 r = vrc::make_rotation_z(0.7f);
    const vrc::float4x4 a = vrc::mul(vrc::make_identity(), r);
    for (int i = 0; i < 16; ++i) EXPECT_NEAR(a.m[i], r.m[i], kEps);
}

TEST(CameraMath, LookAtPutsTargetOnNegativeZ) {
    const vrc::float3 eye{2.0f, 2.0f, 2.0f};
    const vrc::float4x4 v = vrc::make_look_at(eye, {0, 0, 0}, {0, 0, 1});
    const vrc::float3 p   = vrc::transform_point(v, {0, 0, 0});
    EXPECT_NEAR(p.x, 0.0f, kEps);
    EXPECT_NEAR(p.y, 0.0f, kEps);
    EXPECT_NEAR(p.z, -vrc::length(eye), kEps);
}

TEST(CameraMath, PerspectiveMapsNearFarToZeroOne) {
    const vrc::float4x4 p = vrc::make_perspective(vrc::radians(90.0f), 1.0f, 0.1f, 100.0f);
    EXPECT_NEAR(vrc::transform_point(p, {0, 0, -0.1f}).z, 0.0f, kEps);
    EXPECT_NEAR(vrc::transform_point(p, {0, 0, -100.0f}).z, 1.0f, kEps);
}

TEST(CameraMath, PerspectiveFlipsYForVulkanClipSpace) {
    const vrc::float4x4 p = vrc::make_perspective(vrc::radians(90.0f), 1.0f, 0.1f, 100.0f);
    const vrc::float3 up  = vrc::transform_point(p, {0, 1.0f, -1.0f});
    EXPECT_NEAR(up.y, -1.0f, kEps);
}

TEST(CameraMath, RotationZQuarterTurn) {
    const vrc::float3 r = vrc::transform_point(vrc::make_rotation_z(vrc::radians(90.0f)), {1, 0, 0});
    EXPECT_NEAR(r.x, 0.0f, kEps);
    EXPECT_NEAR(r.y, 1.0f, kEps);
}

TEST(Camera, DefaultFramesTheOrigin) {
    const vrc::Camera cam{};
    const vrc::float4x4 vp = vrc::mul(cam.projection(16.0f / 9.0f), cam.view());
    const vrc::float3 ndc  = vrc::transform_point(vp, {0, 0, 0});
    EXPECT_NEAR(ndc.x, 0.0f, kEps);
    EXPECT_NEAR(ndc.y, 0.0f, kEps);
    EXPECT_GT(ndc.z, 0.0f);
    EXPECT_LT(ndc.z, 1.0f);
}

TEST(Transforms, Std140LayoutIsThreeMat4) { EXPECT_EQ(sizeof(vrc::Transforms), 3u * 16u * sizeof(float)); }
