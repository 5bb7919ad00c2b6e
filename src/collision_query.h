#pragma once

#include <glm/glm.hpp>

class ChunkStore;

// Point-in-solid-voxel tests against resident chunk data. Unresident chunks read as empty.
class CollisionQuery
{
public:
    explicit CollisionQuery(const ChunkStore& store) noexcept;

    [[nodiscard]] bool isSolid(const glm::vec3& worldPoint) const;
    [[nodiscard]] bool isSolidVoxel(const glm::ivec3& worldVoxel) const;

private:
    const ChunkStore& store_;
};
