#pragma once
// voxel_grid.h
// Dense solid/empty occupancy for the voxels of a single chunk.

#include <bitset>
#include <cstddef>

#include "chunk_coords.h"

class VoxelGrid
{
public:
    VoxelGrid() = default;

    static constexpr bool inBounds(int x, int y, int z) noexcept
    {
        return x >= 0 && x < kChunkSizeX &&
               y >= 0 && y < kChunkSizeY &&
               z >= 0 && z < kChunkSizeZ;
    }

    static constexpr std::size_t index(int x, int y, int z) noexcept
    {
        return static_cast<std::size_t>(y) * (kChunkSizeX * kChunkSizeZ) +
               static_cast<std::size_t>(z) * kChunkSizeX +
               static_cast<std::size_t>(x);
    }

    // Unchecked; callers guarantee local coordinates are in range.
    [[nodiscard]] bool solid(int x, int y, int z) const noexcept
    {
        return bits_[index(x, y, z)];
    }

    // Out-of-grid positions read as empty.
    [[nodiscard]] bool solidOrEmpty(int x, int y, int z) const noexcept
    {
        return inBounds(x, y, z) && bits_[index(x, y, z)];
    }

    bool at(int x, int y, int z) const;

    void set(int x, int y, int z, bool solid) noexcept
    {
        bits_.set(index(x, y, z), solid);
    }

    std::size_t solidCount() const noexcept { return bits_.count(); }
    bool empty() const noexcept { return bits_.none(); }

    bool operator==(const VoxelGrid& other) const noexcept { return bits_ == other.bits_; }
    bool operator!=(const VoxelGrid& other) const noexcept { return !(*this == other); }

private:
    std::bitset<kChunkVoxelCount> bits_{};
};
