#include "voxel_grid.h"

#include <sstream>
#include <stdexcept>

bool VoxelGrid::at(int x, int y, int z) const
{
    if (!inBounds(x, y, z))
    {
        std::ostringstream oss;
        oss << "Voxel (" << x << ", " << y << ", " << z << ") is outside the chunk grid";
        throw std::out_of_range(oss.str());
    }
    return solid(x, y, z);
}
