#include "terrain/height_field.h"

#include <algorithm>
#include <cmath>
#include <random>

#include <glm/gtc/noise.hpp>

namespace terrain
{

HeightField::HeightField(unsigned seed, const HeightFieldSettings& settings)
    : seed_(seed),
      settings_(settings)
{
    std::mt19937 rng(seed_);
    std::uniform_real_distribution<float> dist(-1000.0f, 1000.0f);
    for (auto& offset : octaveOffsets_)
    {
        offset = {dist(rng), dist(rng)};
    }
}

float HeightField::noise(float worldX, float worldZ) const noexcept
{
    float amplitude = 1.0f;
    float frequency = settings_.frequency;
    float value = 0.0f;
    float normalization = 0.0f;

    const int octaveCount = std::clamp(settings_.octaves, 1, kMaxOctaves);
    for (int i = 0; i < octaveCount; ++i)
    {
        const glm::vec2 sample{worldX * frequency + octaveOffsets_[i].x,
                               worldZ * frequency + octaveOffsets_[i].y};
        value += glm::perlin(sample) * amplitude;
        normalization += amplitude;

        amplitude *= settings_.gain;
        frequency *= settings_.lacunarity;
    }

    if (normalization > 0.0f)
    {
        value /= normalization;
    }

    return value;
}

int HeightField::height(int worldX, int worldZ) const noexcept
{
    const float n = noise(static_cast<float>(worldX), static_cast<float>(worldZ));
    return static_cast<int>(std::floor(n * settings_.amplitude + settings_.offset));
}

} // namespace terrain
