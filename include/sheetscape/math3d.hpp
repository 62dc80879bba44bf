#pragma once

#include <cmath>
#include <optional>

namespace sheetscape
{

// ─── vec3 ────────────────────────────────────────────────────────────────────

struct vec3
{
    double x = 0.0, y = 0.0, z = 0.0;

    constexpr vec3() = default;
    constexpr vec3(double x_, double y_, double z_) : x(x_), y(y_), z(z_) {}

    constexpr vec3  operator+(vec3 b) const { return {x + b.x, y + b.y, z + b.z}; }
    constexpr vec3  operator-(vec3 b) const { return {x - b.x, y - b.y, z - b.z}; }
    constexpr vec3  operator*(double s) const { return {x * s, y * s, z * s}; }
    constexpr vec3  operator/(double s) const { return {x / s, y / s, z / s}; }
    constexpr vec3  operator-() const { return {-x, -y, -z}; }
    constexpr vec3& operator+=(vec3 b)
    {
        x += b.x;
        y += b.y;
        z += b.z;
        return *this;
    }
    constexpr bool operator==(vec3 b) const { return x == b.x && y == b.y && z == b.z; }
    constexpr bool operator!=(vec3 b) const { return !(*this == b); }
};

inline constexpr double vec3_dot(vec3 a, vec3 b)
{
    return a.x * b.x + a.y * b.y + a.z * b.z;
}

inline constexpr vec3 vec3_cross(vec3 a, vec3 b)
{
    return {a.y * b.z - a.z * b.y, a.z * b.x - a.x * b.z, a.x * b.y - a.y * b.x};
}

inline double vec3_length(vec3 v)
{
    return std::sqrt(vec3_dot(v, v));
}

inline vec3 vec3_normalize(vec3 v)
{
    double len = vec3_length(v);
    return len > 1e-12 ? v / len : vec3{0.0, 0.0, 0.0};
}

inline constexpr vec3 vec3_lerp(vec3 a, vec3 b, double t)
{
    return a + (b - a) * t;
}

// ─── vec4 ────────────────────────────────────────────────────────────────────

struct vec4
{
    double x = 0.0, y = 0.0, z = 0.0, w = 0.0;

    constexpr vec4() = default;
    constexpr vec4(double x_, double y_, double z_, double w_) : x(x_), y(y_), z(z_), w(w_) {}
    constexpr vec4(vec3 v, double w_) : x(v.x), y(v.y), z(v.z), w(w_) {}

    constexpr vec3 xyz() const { return {x, y, z}; }
};

// ─── mat4 ────────────────────────────────────────────────────────────────────
// Column-major, m[col * 4 + row].

struct mat4
{
    float m[16]{};

    constexpr float&       operator()(int row, int col) { return m[col * 4 + row]; }
    constexpr const float& operator()(int row, int col) const { return m[col * 4 + row]; }
};

inline constexpr mat4 mat4_identity()
{
    mat4 r;
    r.m[0]  = 1.0f;
    r.m[5]  = 1.0f;
    r.m[10] = 1.0f;
    r.m[15] = 1.0f;
    return r;
}

inline constexpr mat4 mat4_mul(const mat4& a, const mat4& b)
{
    mat4 r;
    for (int col = 0; col < 4; ++col)
    {
        for (int row = 0; row < 4; ++row)
        {
            float sum = 0.0f;
            for (int k = 0; k < 4; ++k)
                sum += a(row, k) * b(k, col);
            r(row, col) = sum;
        }
    }
    return r;
}

inline constexpr vec4 mat4_mul_vec4(const mat4& m, vec4 v)
{
    return {
        m(0, 0) * v.x + m(0, 1) * v.y + m(0, 2) * v.z + m(0, 3) * v.w,
        m(1, 0) * v.x + m(1, 1) * v.y + m(1, 2) * v.z + m(1, 3) * v.w,
        m(2, 0) * v.x + m(2, 1) * v.y + m(2, 2) * v.z + m(2, 3) * v.w,
        m(3, 0) * v.x + m(3, 1) * v.y + m(3, 2) * v.z + m(3, 3) * v.w,
    };
}

inline constexpr mat4 mat4_translate(vec3 t)
{
    mat4 r   = mat4_identity();
    r(0, 3) = static_cast<float>(t.x);
    r(1, 3) = static_cast<float>(t.y);
    r(2, 3) = static_cast<float>(t.z);
    return r;
}

// Right-handed yaw about +Y.
inline mat4 mat4_rotate_y(float angle_rad)
{
    float c = std::cos(angle_rad), s = std::sin(angle_rad);
    mat4  r = mat4_identity();
    r(0, 0) = c;
    r(0, 2) = s;
    r(2, 0) = -s;
    r(2, 2) = c;
    return r;
}

inline mat4 mat4_look_at(vec3 eye, vec3 target, vec3 up)
{
    vec3 f = vec3_normalize(target - eye);
    vec3 s = vec3_normalize(vec3_cross(f, up));
    vec3 u = vec3_cross(s, f);

    mat4 m  = mat4_identity();
    m(0, 0) = static_cast<float>(s.x);
    m(0, 1) = static_cast<float>(s.y);
    m(0, 2) = static_cast<float>(s.z);
    m(1, 0) = static_cast<float>(u.x);
    m(1, 1) = static_cast<float>(u.y);
    m(1, 2) = static_cast<float>(u.z);
    m(2, 0) = static_cast<float>(-f.x);
    m(2, 1) = static_cast<float>(-f.y);
    m(2, 2) = static_cast<float>(-f.z);
    m(0, 3) = static_cast<float>(-vec3_dot(s, eye));
    m(1, 3) = static_cast<float>(-vec3_dot(u, eye));
    m(2, 3) = static_cast<float>(vec3_dot(f, eye));
    return m;
}

// Depth range [0,1], Y pointing down in NDC (Vulkan convention).
inline mat4 mat4_perspective(float fov_y_rad, float aspect, float near_z, float far_z)
{
    float t = std::tan(fov_y_rad * 0.5f);
    mat4  m;
    m(0, 0) = 1.0f / (aspect * t);
    m(1, 1) = -1.0f / t;
    m(2, 2) = far_z / (near_z - far_z);
    m(3, 2) = -1.0f;
    m(2, 3) = (near_z * far_z) / (near_z - far_z);
    return m;
}

// Gauss-Jordan elimination with partial pivoting. Singular input yields identity.
inline mat4 mat4_inverse(const mat4& in)
{
    double a[4][8];
    for (int r = 0; r < 4; ++r)
    {
        for (int c = 0; c < 4; ++c)
        {
            a[r][c]     = in(r, c);
            a[r][c + 4] = (r == c) ? 1.0 : 0.0;
        }
    }

    for (int col = 0; col < 4; ++col)
    {
        int    pivot = col;
        double best  = std::fabs(a[col][col]);
        for (int r = col + 1; r < 4; ++r)
        {
            if (std::fabs(a[r][col]) > best)
            {
                best  = std::fabs(a[r][col]);
                pivot = r;
            }
        }
        if (best < 1e-12)
            return mat4_identity();

        if (pivot != col)
        {
            for (int c = 0; c < 8; ++c)
            {
                double tmp   = a[col][c];
                a[col][c]    = a[pivot][c];
                a[pivot][c]  = tmp;
            }
        }

        double inv = 1.0 / a[col][col];
        for (int c = 0; c < 8; ++c)
            a[col][c] *= inv;

        for (int r = 0; r < 4; ++r)
        {
            if (r == col)
                continue;
            double factor = a[r][col];
            if (factor == 0.0)
                continue;
            for (int c = 0; c < 8; ++c)
                a[r][c] -= factor * a[col][c];
        }
    }

    mat4 out;
    for (int r = 0; r < 4; ++r)
        for (int c = 0; c < 4; ++c)
            out(r, c) = static_cast<float>(a[r][c + 4]);
    return out;
}

// ─── Ray / Plane ─────────────────────────────────────────────────────────────

struct Ray
{
    vec3 origin;
    vec3 direction;
};

struct Plane
{
    vec3 point;
    vec3 normal{0.0, 0.0, 1.0};
};

// Screen pixel (origin top-left) to a world-space ray through the view volume.
inline Ray unproject(float       screen_x,
                     float       screen_y,
                     const mat4& view_proj_inv,
                     float       viewport_w,
                     float       viewport_h)
{
    if (viewport_w <= 0.0f || viewport_h <= 0.0f)
        return {{0.0, 0.0, 0.0}, {0.0, 0.0, -1.0}};

    double ndc_x = 2.0 * screen_x / viewport_w - 1.0;
    double ndc_y = 2.0 * screen_y / viewport_h - 1.0;

    vec4 near_pt = mat4_mul_vec4(view_proj_inv, {ndc_x, ndc_y, 0.0, 1.0});
    vec4 far_pt  = mat4_mul_vec4(view_proj_inv, {ndc_x, ndc_y, 1.0, 1.0});

    if (std::fabs(near_pt.w) < 1e-12 || std::fabs(far_pt.w) < 1e-12)
        return {{0.0, 0.0, 0.0}, {0.0, 0.0, -1.0}};

    vec3 near3 = near_pt.xyz() / near_pt.w;
    vec3 far3  = far_pt.xyz() / far_pt.w;
    return {near3, vec3_normalize(far3 - near3)};
}

// Empty when the ray is parallel to the plane or the hit lies behind the origin.
inline std::optional<vec3> ray_plane_intersect(const Ray& ray, const Plane& plane)
{
    double denom = vec3_dot(plane.normal, ray.direction);
    if (std::fabs(denom) < 1e-9)
        return std::nullopt;
    double t = vec3_dot(plane.point - ray.origin, plane.normal) / denom;
    if (t < 0.0)
        return std::nullopt;
    return ray.origin + ray.direction * t;
}

// ─── Utility ─────────────────────────────────────────────────────────────────

inline constexpr float PI = 3.14159265358979323846f;

inline constexpr float deg_to_rad(float deg)
{
    return deg * PI / 180.0f;
}

inline constexpr float clampf(float v, float lo, float hi)
{
    return v < lo ? lo : (v > hi ? hi : v);
}

inline constexpr double clampd(double v, double lo, double hi)
{
    return v < lo ? lo : (v > hi ? hi : v);
}

}   // namespace sheetscape
