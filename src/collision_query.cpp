#include "collision_query.h"

#include "chunk_coords.h"
#include "chunk_store.h"

CollisionQuery::CollisionQuery(const ChunkStore& store) noexcept
    : store_(store)
{
}

bool CollisionQuery::isSolid(const glm::vec3& worldPoint) const
{
    // No chunk outside the world bounds can be resident.
    if (!isWithinWorldBounds(worldPoint))
    {
        return false;
    }
    return isSolidVoxel(floorToVoxel(worldPoint));
}

bool CollisionQuery::isSolidVoxel(const glm::ivec3& worldVoxel) const
{
    const std::shared_ptr<const VoxelGrid> grid = store_.find(worldToChunkCoords(worldVoxel));
    if (!grid)
    {
        return false;
    }

    const glm::ivec3 local = worldToLocalCoords(worldVoxel);
    return grid->solid(local.x, local.y, local.z);
}
