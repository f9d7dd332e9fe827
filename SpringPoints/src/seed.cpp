#include "seed.h"
#include <iterator>

static constexpr SeedPoint kSeedPoints[] = {
    {202.0f,  78.0f, 0.0f, 9.0f, 0xed9d33}, {348.0f,  83.0f, 0.0f, 9.0f, 0xd44d61},
    {256.0f,  69.0f, 0.0f, 9.0f, 0x4f7af2}, {214.0f,  59.0f, 0.0f, 9.0f, 0xef9a1e},
    {265.0f,  36.0f, 0.0f, 9.0f, 0x4976f3}, {300.0f,  78.0f, 0.0f, 9.0f, 0x269230},
    {294.0f,  59.0f, 0.0f, 9.0f, 0x1f9e2c}, { 45.0f,  88.0f, 0.0f, 9.0f, 0x1c48dd},
    {268.0f,  52.0f, 0.0f, 9.0f, 0x2a56ea}, { 73.0f,  83.0f, 0.0f, 9.0f, 0x3355d8},
    {294.0f,   6.0f, 0.0f, 9.0f, 0x36b641}, {235.0f,  62.0f, 0.0f, 9.0f, 0x2e5def},
    {353.0f,  42.0f, 0.0f, 8.0f, 0xd53747}, {336.0f,  52.0f, 0.0f, 8.0f, 0xeb676f},
    {208.0f,  41.0f, 0.0f, 8.0f, 0xf9b125}, {321.0f,  70.0f, 0.0f, 8.0f, 0xde3646},
    {  8.0f,  60.0f, 0.0f, 8.0f, 0x2a59f0}, {180.0f,  81.0f, 0.0f, 8.0f, 0xeb9c31},
    {146.0f,  65.0f, 0.0f, 8.0f, 0xc41731}, {145.0f,  49.0f, 0.0f, 8.0f, 0xd82038},
    {246.0f,  34.0f, 0.0f, 8.0f, 0x5f8af8}, {169.0f,  69.0f, 0.0f, 8.0f, 0xefa11e},
    {273.0f,  99.0f, 0.0f, 8.0f, 0x2e55e2}, {248.0f, 120.0f, 0.0f, 8.0f, 0x4167e4},
    {294.0f,  41.0f, 0.0f, 8.0f, 0x0b991a}, {267.0f, 114.0f, 0.0f, 8.0f, 0x4869e3},
    { 78.0f,  67.0f, 0.0f, 8.0f, 0x3059e3}, {294.0f,  23.0f, 0.0f, 8.0f, 0x10a11d},
    {117.0f,  83.0f, 0.0f, 8.0f, 0xcf4055}, {137.0f,  80.0f, 0.0f, 8.0f, 0xcd4359},
    { 14.0f,  71.0f, 0.0f, 8.0f, 0x2855ea}, {331.0f,  80.0f, 0.0f, 8.0f, 0xca273c},
    { 25.0f,  82.0f, 0.0f, 8.0f, 0x2650e1}, {233.0f,  46.0f, 0.0f, 8.0f, 0x4a7bf9},
    { 73.0f,  13.0f, 0.0f, 8.0f, 0x3d65e7}, {327.0f,  35.0f, 0.0f, 6.0f, 0xf47875},
    {319.0f,  46.0f, 0.0f, 6.0f, 0xf36764}, {256.0f,  81.0f, 0.0f, 6.0f, 0x1d4eeb},
    {244.0f,  88.0f, 0.0f, 6.0f, 0x698bf1}, {194.0f,  32.0f, 0.0f, 6.0f, 0xfac652},
    { 97.0f,  56.0f, 0.0f, 6.0f, 0xee5257}, {105.0f,  75.0f, 0.0f, 6.0f, 0xcf2a3f},
    { 42.0f,   4.0f, 0.0f, 6.0f, 0x5681f5}, { 10.0f,  27.0f, 0.0f, 6.0f, 0x4577f6},
    {166.0f,  55.0f, 0.0f, 6.0f, 0xf7b326}, {266.0f,  88.0f, 0.0f, 6.0f, 0x2b58e8},
    {178.0f,  34.0f, 0.0f, 6.0f, 0xfacb5e}, {100.0f,  65.0f, 0.0f, 6.0f, 0xe02e3d},
    {343.0f,  32.0f, 0.0f, 6.0f, 0xf16d6f}, { 59.0f,   5.0f, 0.0f, 6.0f, 0x507bf2},
    { 27.0f,   9.0f, 0.0f, 6.0f, 0x5683f7}, {233.0f, 116.0f, 0.0f, 6.0f, 0x3158e2},
    {123.0f,  32.0f, 0.0f, 6.0f, 0xf0696c}, {  6.0f,  38.0f, 0.0f, 6.0f, 0x3769f6},
    { 63.0f,  62.0f, 0.0f, 6.0f, 0x6084ef}, {  6.0f,  49.0f, 0.0f, 6.0f, 0x2a5cf4},
    {108.0f,  36.0f, 0.0f, 6.0f, 0xf4716e}, {169.0f,  43.0f, 0.0f, 6.0f, 0xf8c247},
    {137.0f,  37.0f, 0.0f, 6.0f, 0xe74653}, {318.0f,  58.0f, 0.0f, 6.0f, 0xec4147},
    {226.0f, 100.0f, 0.0f, 5.0f, 0x4876f1}, {101.0f,  46.0f, 0.0f, 5.0f, 0xef5c5c},
    {226.0f, 108.0f, 0.0f, 5.0f, 0x2552ea}, { 17.0f,  17.0f, 0.0f, 5.0f, 0x4779f7},
    {232.0f,  93.0f, 0.0f, 5.0f, 0x4b78f1},
};

std::span<const SeedPoint> seed_points() {
    return kSeedPoints;
}

PointField make_seeded_field(float surface_width, float surface_height) {
    Position offset = shape_offset(surface_width, surface_height);

    PointField field(offset);
    field.reserve(std::size(kSeedPoints));
    for (const auto& s : kSeedPoints) {
        field.add_point(offset.x + s.x, offset.y + s.y, s.z, s.size,
                        Color::from_rgb24(s.rgb));
    }
    return field;
}
