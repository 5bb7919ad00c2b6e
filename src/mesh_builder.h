#pragma once
// mesh_builder.h
// Converts a chunk voxel grid into indexed triangle geometry in chunk-local space.

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

#include <glm/vec3.hpp>

class VoxelGrid;

struct MeshData
{
    std::vector<glm::vec3> vertices;
    std::vector<std::uint32_t> indices;
    std::vector<glm::vec3> normals;

    void clear()
    {
        vertices.clear();
        indices.clear();
        normals.clear();
    }

    bool empty() const noexcept { return indices.empty(); }
    std::size_t triangleCount() const noexcept { return indices.size() / 3; }
};

enum class MeshStrategy : std::uint8_t
{
    Naive,
    Culled,
    Greedy
};

std::optional<MeshStrategy> parseMeshStrategy(std::string_view name) noexcept;
const char* toString(MeshStrategy strategy) noexcept;

class MeshBuilder
{
public:
    explicit MeshBuilder(MeshStrategy strategy = MeshStrategy::Greedy) noexcept;

    [[nodiscard]] MeshData build(const VoxelGrid& grid) const;

    MeshStrategy strategy() const noexcept { return strategy_; }

private:
    // One closed cube per solid voxel, eight shared corners.
    void buildNaive(const VoxelGrid& grid, MeshData& mesh) const;
    // One quad per face whose neighbour is empty or outside the grid.
    void buildCulled(const VoxelGrid& grid, MeshData& mesh) const;
    // Culled faces merged into maximal rectangles per slice.
    void buildGreedy(const VoxelGrid& grid, MeshData& mesh) const;

    MeshStrategy strategy_;
};
