#pragma once
// render_sink.h
// Boundary to whatever draws chunk geometry. The streaming core only hands meshes over.

#include <cstdint>

#include <glm/vec3.hpp>

struct MeshData;

using RenderHandle = std::uint64_t;

class RenderSink
{
public:
    virtual ~RenderSink() = default;

    // Geometry is in chunk-local space; worldOffset is the chunk origin (coord * chunk size).
    virtual RenderHandle spawn(const MeshData& mesh, const glm::vec3& worldOffset) = 0;
    virtual void despawn(RenderHandle handle) = 0;
};
