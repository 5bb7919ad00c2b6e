#pragma once

#include <array>

#include <glm/vec2.hpp>

namespace terrain
{

struct HeightFieldSettings
{
    float frequency{0.01f};
    float amplitude{32.0f};
    float offset{32.0f};
    int octaves{1};
    float gain{0.5f};
    float lacunarity{2.0f};
};

// Deterministic terrain height from seeded Perlin noise.
class HeightField
{
public:
    static constexpr int kMaxOctaves = 16;

    explicit HeightField(unsigned seed, const HeightFieldSettings& settings = {});

    [[nodiscard]] int height(int worldX, int worldZ) const noexcept;

    // Normalised noise in roughly [-1, 1] before amplitude and offset are applied.
    [[nodiscard]] float noise(float worldX, float worldZ) const noexcept;

    unsigned seed() const noexcept { return seed_; }
    const HeightFieldSettings& settings() const noexcept { return settings_; }

private:
    unsigned seed_{0};
    HeightFieldSettings settings_{};
    std::array<glm::vec2, kMaxOctaves> octaveOffsets_{};
};

} // namespace terrain
