#include "terrain/terrain_generator.h"

#include <algorithm>
#include <limits>
#include <stdexcept>
#include <utility>

#include "terrain/height_field.h"

namespace terrain
{

TerrainGenerator::TerrainGenerator(SampleColumnFn sampler)
    : sampler_(std::move(sampler))
{
    if (!sampler_)
    {
        throw std::invalid_argument("TerrainGenerator requires a column sampler");
    }
}

TerrainGenerator::TerrainGenerator(const HeightField& heightField)
    : TerrainGenerator([&heightField](int worldX, int worldZ) { return heightField.height(worldX, worldZ); })
{
}

VoxelGrid TerrainGenerator::generateChunk(const glm::ivec3& chunkCoord, ChunkGenerationSummary* summary) const
{
    if (!isChunkWithinWorldBounds(chunkCoord))
    {
        throw std::out_of_range("Chunk coordinate is outside the world bounds");
    }

    VoxelGrid grid;

    const int baseWorldX = chunkCoord.x * kChunkSizeX;
    const int baseWorldY = chunkCoord.y * kChunkSizeY;
    const int baseWorldZ = chunkCoord.z * kChunkSizeZ;

    int minHeight = std::numeric_limits<int>::max();
    int maxHeight = std::numeric_limits<int>::min();

    for (int localX = 0; localX < kChunkSizeX; ++localX)
    {
        for (int localZ = 0; localZ < kChunkSizeZ; ++localZ)
        {
            const int columnHeight = sampler_(baseWorldX + localX, baseWorldZ + localZ);
            minHeight = std::min(minHeight, columnHeight);
            maxHeight = std::max(maxHeight, columnHeight);

            // Solid below the surface; clamp keeps the loop inside the slab.
            const int solidTop = std::clamp(columnHeight - baseWorldY, 0, kChunkSizeY);
            for (int localY = 0; localY < solidTop; ++localY)
            {
                grid.set(localX, localY, localZ, true);
            }
        }
    }

    if (summary)
    {
        summary->solidVoxels = grid.solidCount();
        summary->minColumnHeight = minHeight;
        summary->maxColumnHeight = maxHeight;
    }

    return grid;
}

VoxelGrid generateVoxelGrid(const glm::ivec3& chunkCoord, const HeightField& heightField)
{
    return TerrainGenerator(heightField).generateChunk(chunkCoord);
}

} // namespace terrain
