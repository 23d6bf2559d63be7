// ============================================================================
// Vulkan RenderCore - vrc_camera.cpp
// Column-major matrix helpers and the look-at camera.
// ============================================================================
#include "vrc_camera.h"

#include <cmath>
#include <numbers>

namespace vrc {

float3 make_float3(float x, float y, float z) { return float3{x, y, z}; }
float3 operator+(const float3& a, const float3& b) { return {a.x + b.x, a.y + b.y, a.z + b.z}; }
float3 operator-(const float3& a, const float3& b) { return {a.x - b.x, a.y - b.y, a.z - b.z}; }
float3 operator*(const float3& a, float s) { return {a.x * s, a.y * s, a.z * s}; }
float dot(const float3& a, const float3& b) { return a.x * b.x + a.y * b.y + a.z * b.z; }
float3 cross(const float3& a, const float3& b) { return {a.y * b.z - a.z * b.y, a.z * b.x - a.x * b.z, a.x * b.y - a.y * b.x}; }
float length(const float3& a) { return std::sqrt(dot(a, a)); }
float3 normalize(const float3& a) {
    const float len = length(a);
    return len > 0.0f ? a * (1.0f / len) : a;
}
float radians(float degrees) { return degrees * std::numbers::pi_v<float> / 180.0f; }

float4x4 make_identity() {
    float4x4 r{};
    r.m[0] = r.m[5] = r.m[10] = r.m[15] = 1.0f;
    return r;
}

float4x4 mul(const float4x4& a, const float4x4& b) {
    float4x4 r{};
    for (int c = 0; c < 4; ++c)
        for (int row = 0; row < 4; ++row) {
            float s = 0.0f;
            for (int k = 0; k < 4; ++k) s += a.m[k * 4 + row] * b.m[c * 4 + k];
            r.m[c * 4 + row] = s;
        }
    return r;
}

float3 transform_point(const float4x4& m, const float3& p) {
    const float x = m.m[0] * p.x + m.m[4] * p.y + m.m[8] * p.z + m.m[12];
    const float y = m.m[1] * p.x + m.m[5] * p.y + m.m[9] * p.z + m.m[13];
    const float z = m.m[2] * p.x + m.m[6] * p.y + m.m[10] * p.z + m.m[14];
    const float w = m.m[3] * p.x + m.m[7] * p.y + m.m[11] * p.z + m.m[15];
    if (w == 0.0f) return {x, y, z};
    return {x / w, y / w, z / w};
}

float4x4 make_look_at(const float3& eye, const float3& center, const float3& up) {
    const float3 f = normalize(center - eye);
    const float3 s = normalize(cross(f, up));
    const float3 u = cross(s, f);
    float4x4 r     = make_identity();
    r.m[0]  = s.x; r.m[4] = s.y; r.m[8]  = s.z;
    r.m[1]  = u.x; r.m[5] = u.y; r.m[9]  = u.z;
    r.m[2]  = -f.x; r.m[6] = -f.y; r.m[10] = -f.z;
    r.m[12] = -dot(s, eye);
    r.m[13] = -dot(u, eye);
    r.m[14] = dot(f, eye);
    return r;
}

float4x4 make_perspective(float fovy_rad, float aspect, float znear, float zfar) {
    const float f = 1.0f / std::tan(fovy_rad * 0.5f);
    float4x4 r{};
    r.m[0]  = f / aspect;
    r.m[5]  = -f;
    r.m[10] = zfar / (znear - zfar);
    r.m[11] = -1.0f;
    r.m[14] = (znear * zfar) / (znear - zfar);
    return r;
}

float4x4 make_rotation_z(float angle_rad) {
    const float c = std::cos(angle_rad);
    const float s = std::sin(angle_rad);
    float4x4 r    = make_identity();
    r.m[0] = c; r.m[1] = s;
    r.m[4] = -s; r.m[5] = c;
    return r;
}

float4x4 Camera::view() const { return make_look_at(eye, target, up); }
float4x4 Camera::projection(float aspect) const { return make_perspective(radians(fov_y_deg), aspect, znear, zfar); }

} // namespace vrc
