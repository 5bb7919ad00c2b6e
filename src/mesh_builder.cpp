#include "mesh_builder.h"

#include <array>
#include <vector>

#include <glm/glm.hpp>

#include "voxel_grid.h"

namespace
{

// Unit cube corners: bottom ring at z = 0, top ring at z = 1.
const std::array<glm::ivec3, 8> kCubeCorners = {{
    {0, 0, 0}, {1, 0, 0}, {1, 1, 0}, {0, 1, 0},
    {0, 0, 1}, {1, 0, 1}, {1, 1, 1}, {0, 1, 1},
}};

struct FaceDefinition
{
    glm::ivec3 normal;
    std::array<int, 4> corners; // counter-clockwise seen from outside
};

const std::array<FaceDefinition, 6> kFaces = {{
    {{-1, 0, 0}, {0, 4, 7, 3}},
    {{1, 0, 0}, {1, 2, 6, 5}},
    {{0, -1, 0}, {0, 1, 5, 4}},
    {{0, 1, 0}, {3, 7, 6, 2}},
    {{0, 0, -1}, {0, 3, 2, 1}},
    {{0, 0, 1}, {4, 5, 6, 7}},
}};

void appendQuadIndices(MeshData& mesh, std::uint32_t base)
{
    mesh.indices.push_back(base + 0);
    mesh.indices.push_back(base + 1);
    mesh.indices.push_back(base + 2);
    mesh.indices.push_back(base + 2);
    mesh.indices.push_back(base + 3);
    mesh.indices.push_back(base + 0);
}

} // namespace

std::optional<MeshStrategy> parseMeshStrategy(std::string_view name) noexcept
{
    if (name == "naive")
    {
        return MeshStrategy::Naive;
    }
    if (name == "culled")
    {
        return MeshStrategy::Culled;
    }
    if (name == "greedy")
    {
        return MeshStrategy::Greedy;
    }
    return std::nullopt;
}

const char* toString(MeshStrategy strategy) noexcept
{
    switch (strategy)
    {
    case MeshStrategy::Naive:
        return "naive";
    case MeshStrategy::Culled:
        return "culled";
    case MeshStrategy::Greedy:
        return "greedy";
    }
    return "unknown";
}

MeshBuilder::MeshBuilder(MeshStrategy strategy) noexcept
    : strategy_(strategy)
{
}

MeshData MeshBuilder::build(const VoxelGrid& grid) const
{
    MeshData mesh;
    if (grid.empty())
    {
        return mesh;
    }

    switch (strategy_)
    {
    case MeshStrategy::Naive:
        buildNaive(grid, mesh);
        break;
    case MeshStrategy::Culled:
        buildCulled(grid, mesh);
        break;
    case MeshStrategy::Greedy:
        buildGreedy(grid, mesh);
        break;
    }
    return mesh;
}

void MeshBuilder::buildNaive(const VoxelGrid& grid, MeshData& mesh) const
{
    const std::size_t solid = grid.solidCount();
    mesh.vertices.reserve(solid * 8);
    mesh.normals.reserve(solid * 8);
    mesh.indices.reserve(solid * 36);

    for (int x = 0; x < kChunkSizeX; ++x)
    {
        for (int y = 0; y < kChunkSizeY; ++y)
        {
            for (int z = 0; z < kChunkSizeZ; ++z)
            {
                if (!grid.solid(x, y, z))
                {
                    continue;
                }

                const std::uint32_t base = static_cast<std::uint32_t>(mesh.vertices.size());
                const glm::vec3 origin{static_cast<float>(x), static_cast<float>(y), static_cast<float>(z)};
                for (const glm::ivec3& corner : kCubeCorners)
                {
                    mesh.vertices.push_back(origin + glm::vec3(corner));
                    mesh.normals.emplace_back(0.0f, 0.0f, corner.z == 0 ? -1.0f : 1.0f);
                }

                for (const FaceDefinition& face : kFaces)
                {
                    mesh.indices.push_back(base + static_cast<std::uint32_t>(face.corners[0]));
                    mesh.indices.push_back(base + static_cast<std::uint32_t>(face.corners[1]));
                    mesh.indices.push_back(base + static_cast<std::uint32_t>(face.corners[2]));
                    mesh.indices.push_back(base + static_cast<std::uint32_t>(face.corners[2]));
                    mesh.indices.push_back(base + static_cast<std::uint32_t>(face.corners[3]));
                    mesh.indices.push_back(base + static_cast<std::uint32_t>(face.corners[0]));
                }
            }
        }
    }
}

void MeshBuilder::buildCulled(const VoxelGrid& grid, MeshData& mesh) const
{
    for (int x = 0; x < kChunkSizeX; ++x)
    {
        for (int y = 0; y < kChunkSizeY; ++y)
        {
            for (int z = 0; z < kChunkSizeZ; ++z)
            {
                if (!grid.solid(x, y, z))
                {
                    continue;
                }

                const glm::ivec3 voxel{x, y, z};
                for (const FaceDefinition& face : kFaces)
                {
                    const glm::ivec3 neighbor = voxel + face.normal;
                    if (grid.solidOrEmpty(neighbor.x, neighbor.y, neighbor.z))
                    {
                        continue;
                    }

                    const std::uint32_t base = static_cast<std::uint32_t>(mesh.vertices.size());
                    const glm::vec3 normal(face.normal);
                    for (int cornerIndex : face.corners)
                    {
                        mesh.vertices.push_back(glm::vec3(voxel + kCubeCorners[cornerIndex]));
                        mesh.normals.push_back(normal);
                    }
                    appendQuadIndices(mesh, base);
                }
            }
        }
    }
}

void MeshBuilder::buildGreedy(const VoxelGrid& grid, MeshData& mesh) const
{
    const int dims[3] = {kChunkSizeX, kChunkSizeY, kChunkSizeZ};

    for (int axis = 0; axis < 3; ++axis)
    {
        const int u = (axis + 1) % 3;
        const int v = (axis + 2) % 3;
        const int du = dims[u];
        const int dv = dims[v];
        const int dw = dims[axis];

        // +1: face of the voxel below the slice looking up the axis, -1: the opposite.
        std::vector<int> mask(static_cast<std::size_t>(du * dv), 0);

        for (int k = 0; k <= dw; ++k)
        {
            for (int j = 0; j < dv; ++j)
            {
                for (int i = 0; i < du; ++i)
                {
                    int a[3];
                    int b[3];
                    a[axis] = k - 1;
                    b[axis] = k;
                    a[u] = b[u] = i;
                    a[v] = b[v] = j;

                    const bool solidA = grid.solidOrEmpty(a[0], a[1], a[2]);
                    const bool solidB = grid.solidOrEmpty(b[0], b[1], b[2]);
                    int faceDir = 0;
                    if (solidA && !solidB)
                    {
                        faceDir = 1;
                    }
                    else if (!solidA && solidB)
                    {
                        faceDir = -1;
                    }
                    mask[static_cast<std::size_t>(j * du + i)] = faceDir;
                }
            }

            for (int j = 0; j < dv; ++j)
            {
                for (int i = 0; i < du;)
                {
                    const int faceDir = mask[static_cast<std::size_t>(j * du + i)];
                    if (faceDir == 0)
                    {
                        ++i;
                        continue;
                    }

                    int width = 1;
                    while (i + width < du && mask[static_cast<std::size_t>(j * du + i + width)] == faceDir)
                    {
                        ++width;
                    }

                    int height = 1;
                    bool canGrow = true;
                    while (j + height < dv && canGrow)
                    {
                        for (int w = 0; w < width; ++w)
                        {
                            if (mask[static_cast<std::size_t>((j + height) * du + i + w)] != faceDir)
                            {
                                canGrow = false;
                                break;
                            }
                        }
                        if (canGrow)
                        {
                            ++height;
                        }
                    }

                    std::array<glm::ivec2, 4> planeCorners;
                    if (faceDir > 0)
                    {
                        planeCorners = {{{i, j}, {i + width, j}, {i + width, j + height}, {i, j + height}}};
                    }
                    else
                    {
                        planeCorners = {{{i, j}, {i, j + height}, {i + width, j + height}, {i + width, j}}};
                    }

                    glm::vec3 normal{0.0f};
                    normal[axis] = static_cast<float>(faceDir);

                    const std::uint32_t base = static_cast<std::uint32_t>(mesh.vertices.size());
                    for (const glm::ivec2& corner : planeCorners)
                    {
                        glm::vec3 position{0.0f};
                        position[axis] = static_cast<float>(k);
                        position[u] = static_cast<float>(corner.x);
                        position[v] = static_cast<float>(corner.y);
                        mesh.vertices.push_back(position);
                        mesh.normals.push_back(normal);
                    }
                    appendQuadIndices(mesh, base);

                    for (int h = 0; h < height; ++h)
                    {
                        for (int w = 0; w < width; ++w)
                        {
                            mask[static_cast<std::size_t>((j + h) * du + i + w)] = 0;
                        }
                    }
                    i += width;
                }
            }
        }
    }
}
