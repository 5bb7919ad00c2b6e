#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include <glm/vec3.hpp>

#include "mesh_builder.h"
#include "terrain/height_field.h"

enum class EvictionPolicy : std::uint8_t
{
    Retain,
    Evict,
    LeastRecentlyUsed
};

std::optional<EvictionPolicy> parseEvictionPolicy(std::string_view name) noexcept;
const char* toString(EvictionPolicy policy) noexcept;

struct StreamingSettings
{
    // Upper bounds keep the desired cube and the worker pool a sane size.
    static constexpr int kMaxRenderDistance = 32;
    static constexpr int kMaxWorkerThreads = 64;

    int renderDistance{3};
    int workerThreads{0};
    int maxLoadsPerTick{0}; // 0 = unlimited
    EvictionPolicy eviction{EvictionPolicy::Retain};
    std::size_t maxResidentChunks{0};
};

struct ObserverSettings
{
    glm::vec3 spawn{0.0f, 50.0f, 0.0f};
    float moveSpeed{5.0f};
    float mouseSensitivity{0.12f};
};

struct WorldConfig
{
    unsigned seed{0};
    terrain::HeightFieldSettings terrain{};
    StreamingSettings streaming{};
    MeshStrategy mesher{MeshStrategy::Greedy};
    ObserverSettings observer{};

    // Missing files yield the defaults above.
    static WorldConfig load(const std::filesystem::path& path);
    static WorldConfig parse(std::string_view document, const std::string& sourceName = "<memory>");
};
