#pragma once
#include <cstdint>

struct Color {
    float r = 1.0f;
    float g = 1.0f;
    float b = 1.0f;

    // 0xRRGGBB, the form the authored shape table uses
    static constexpr Color from_rgb24(std::uint32_t rgb) {
        return {static_cast<float>((rgb >> 16) & 0xff) / 255.0f,
                static_cast<float>((rgb >> 8) & 0xff) / 255.0f,
                static_cast<float>(rgb & 0xff) / 255.0f};
    }

    constexpr bool operator==(const Color&) const = default;
};
