#pragma once

#include <cstdint>

namespace sheetscape
{

struct Color
{
    float r = 0.0f;
    float g = 0.0f;
    float b = 0.0f;
    float a = 1.0f;

    constexpr Color() = default;
    constexpr Color(float r, float g, float b, float a = 1.0f) : r(r), g(g), b(b), a(a) {}

    constexpr Color with_alpha(float alpha) const { return {r, g, b, alpha}; }

    constexpr bool operator==(const Color& o) const
    {
        return r == o.r && g == o.g && b == o.b && a == o.a;
    }
};

inline constexpr Color rgb(float r, float g, float b)
{
    return Color{r, g, b, 1.0f};
}

// 0xRRGGBB
inline constexpr Color hex(uint32_t v, float alpha = 1.0f)
{
    return Color{static_cast<float>((v >> 16) & 0xFF) / 255.0f,
                 static_cast<float>((v >> 8) & 0xFF) / 255.0f,
                 static_cast<float>(v & 0xFF) / 255.0f,
                 alpha};
}

}   // namespace sheetscape
