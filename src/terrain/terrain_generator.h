#pragma once

#include <cstddef>
#include <functional>

#include <glm/vec3.hpp>

#include "voxel_grid.h"

namespace terrain
{

class HeightField;

struct ChunkGenerationSummary
{
    std::size_t solidVoxels{0};
    int minColumnHeight{0};
    int maxColumnHeight{0};
};

// Fills chunk voxel grids from a column height sampler, one sample per (x, z) column.
class TerrainGenerator
{
public:
    using SampleColumnFn = std::function<int(int worldX, int worldZ)>;

    explicit TerrainGenerator(SampleColumnFn sampler);
    explicit TerrainGenerator(const HeightField& heightField);

    VoxelGrid generateChunk(const glm::ivec3& chunkCoord, ChunkGenerationSummary* summary = nullptr) const;

private:
    SampleColumnFn sampler_;
};

// Free-function form for callers that only hold a height field.
VoxelGrid generateVoxelGrid(const glm::ivec3& chunkCoord, const HeightField& heightField);

} // namespace terrain
