#ifndef VULKAN_RENDERCORE_VRC_CAMERA_H
#define VULKAN_RENDERCORE_VRC_CAMERA_H

#include <array>

namespace vrc {

// Minimal math helpers (column-major 4x4, m[col * 4 + row])
struct float3 { float x{}, y{}, z{}; };
struct float4x4 { std::array<float, 16> m{}; };

float3 make_float3(float x, float y, float z);
float3 operator+(const float3& a, const float3& b);
float3 operator-(const float3& a, const float3& b);
float3 operator*(const float3& a, float s);
float  dot(const float3& a, const float3& b);
float3 cross(const float3& a, const float3& b);
float  length(const float3& a);
float3 normalize(const float3& a);
float  radians(float degrees);

float4x4 make_identity();
float4x4 mul(const float4x4& a, const float4x4& b);
float3   transform_point(const float4x4& m, const float3& p); // includes the perspective divide
float4x4 make_look_at(const float3& eye, const float3& center, const float3& up);
// Right-handed, depth in [0, 1], clip-space Y flipped for Vulkan.
float4x4 make_perspective(float fovy_rad, float aspect, float znear, float zfar);
float4x4 make_rotation_z(float angle_rad);

// Uniform block layout at binding 0 (std140: three column-major mat4).
struct Transforms {
    float4x4 model{make_identity()};
    float4x4 view{make_identity()};
    float4x4 projection{make_identity()};
};

struct Camera {
    float3 eye{2.0f, 2.0f, 2.0f};
    float3 target{0.0f, 0.0f, 0.0f};
    float3 up{0.0f, 0.0f, 1.0f};         // Z-up world
    float  fov_y_deg{90.0f};
    float  znear{0.1f};
    float  zfar{100.0f};

    [[nodiscard]] float4x4 view() const;
    [[nodiscard]] float4x4 projection(float aspect) const;
};

} // namespace vrc

#endif // VULKAN_RENDERCORE_VRC_CAMERA_H
