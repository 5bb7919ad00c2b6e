#pragma once
// chunk_coords.h
// Chunk-space constants and the integer arithmetic that maps world positions onto chunks.

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdlib>

#include <glm/glm.hpp>

inline constexpr int kChunkEdgeLength = 16;
inline constexpr int kChunkSizeX = kChunkEdgeLength;
inline constexpr int kChunkSizeY = kChunkEdgeLength;
inline constexpr int kChunkSizeZ = kChunkEdgeLength;
inline constexpr int kChunkVoxelCount = kChunkSizeX * kChunkSizeY * kChunkSizeZ;

// Largest world coordinate magnitude accepted for observer positions and chunk
// generation. Chunk coordinates derived from it still multiply by the edge length
// without leaving int range.
inline constexpr float kMaxWorldExtent = 1.0e9f;
inline constexpr int kMaxChunkCoordinate = static_cast<int>(kMaxWorldExtent) / kChunkEdgeLength + 1;

struct ChunkHasher
{
    std::size_t operator()(const glm::ivec3& v) const noexcept
    {
        std::size_t hash = static_cast<std::size_t>(v.x) * 73856093u;
        hash ^= static_cast<std::size_t>(v.y) * 19349663u;
        hash ^= static_cast<std::size_t>(v.z) * 83492791u;
        return hash;
    }
};

inline int floorDiv(int value, int divisor) noexcept
{
    int quotient = value / divisor;
    int remainder = value % divisor;
    if ((remainder != 0) && ((remainder < 0) != (divisor < 0)))
    {
        --quotient;
    }
    return quotient;
}

// Euclidean remainder: always in [0, modulus) for a positive modulus.
inline int wrapIndex(int value, int modulus) noexcept
{
    int result = value % modulus;
    if (result < 0)
    {
        result += modulus;
    }
    return result;
}

inline glm::ivec3 worldToChunkCoords(const glm::ivec3& worldPos) noexcept
{
    return {floorDiv(worldPos.x, kChunkSizeX), floorDiv(worldPos.y, kChunkSizeY), floorDiv(worldPos.z, kChunkSizeZ)};
}

inline glm::ivec3 worldToLocalCoords(const glm::ivec3& worldPos) noexcept
{
    return {wrapIndex(worldPos.x, kChunkSizeX), wrapIndex(worldPos.y, kChunkSizeY), wrapIndex(worldPos.z, kChunkSizeZ)};
}

inline bool isWithinWorldBounds(const glm::vec3& point) noexcept
{
    for (int axis = 0; axis < 3; ++axis)
    {
        if (!std::isfinite(point[axis]) || std::abs(point[axis]) > kMaxWorldExtent)
        {
            return false;
        }
    }
    return true;
}

inline bool isChunkWithinWorldBounds(const glm::ivec3& chunkCoord) noexcept
{
    for (int axis = 0; axis < 3; ++axis)
    {
        if (chunkCoord[axis] < -kMaxChunkCoordinate || chunkCoord[axis] > kMaxChunkCoordinate)
        {
            return false;
        }
    }
    return true;
}

// Callers keep the point inside isWithinWorldBounds; the int conversion is undefined outside it.
inline glm::ivec3 floorToVoxel(const glm::vec3& point) noexcept
{
    return {
        static_cast<int>(std::floor(point.x)),
        static_cast<int>(std::floor(point.y)),
        static_cast<int>(std::floor(point.z))
    };
}

inline glm::ivec3 worldToChunkCoords(const glm::vec3& point) noexcept
{
    return worldToChunkCoords(floorToVoxel(point));
}

inline glm::vec3 chunkWorldOrigin(const glm::ivec3& chunkCoord) noexcept
{
    return {
        static_cast<float>(chunkCoord.x * kChunkSizeX),
        static_cast<float>(chunkCoord.y * kChunkSizeY),
        static_cast<float>(chunkCoord.z * kChunkSizeZ)
    };
}

inline int chebyshevDistance(const glm::ivec3& a, const glm::ivec3& b) noexcept
{
    return std::max({std::abs(a.x - b.x), std::abs(a.y - b.y), std::abs(a.z - b.z)});
}
