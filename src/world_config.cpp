#include "world_config.h"

#include <cmath>
#include <cstdint>
#include <iostream>
#include <limits>
#include <sstream>
#include <stdexcept>

#include <toml++/toml.h>

namespace
{
float readFloat(const toml::table& table, std::string_view key, float fallback)
{
    if (auto value = table[key].value<double>())
    {
        return static_cast<float>(*value);
    }
    return fallback;
}

[[noreturn]] void throwConfigError(std::string_view section,
                                   std::string_view key,
                                   const std::string& sourceName,
                                   std::string_view problem)
{
    std::ostringstream oss;
    oss << "Config value '" << section << '.' << key << "' in " << sourceName << ' ' << problem;
    throw std::runtime_error(oss.str());
}

int readInt(const toml::table& table,
            std::string_view section,
            std::string_view key,
            int fallback,
            const std::string& sourceName)
{
    if (auto value = table[key].value<std::int64_t>())
    {
        if (*value < std::numeric_limits<int>::min() || *value > std::numeric_limits<int>::max())
        {
            throwConfigError(section, key, sourceName, "is outside the 32-bit integer range");
        }
        return static_cast<int>(*value);
    }
    return fallback;
}

void applyTerrain(const toml::table& terrainTable, terrain::HeightFieldSettings& settings, const std::string& sourceName)
{
    settings.frequency = readFloat(terrainTable, "frequency", settings.frequency);
    settings.amplitude = readFloat(terrainTable, "amplitude", settings.amplitude);
    settings.offset = readFloat(terrainTable, "offset", settings.offset);
    settings.gain = readFloat(terrainTable, "gain", settings.gain);
    settings.lacunarity = readFloat(terrainTable, "lacunarity", settings.lacunarity);
    settings.octaves = readInt(terrainTable, "terrain", "octaves", settings.octaves, sourceName);

    if (settings.frequency < 0.0f || !std::isfinite(settings.frequency))
    {
        throwConfigError("terrain", "frequency", sourceName, "must be non-negative and finite");
    }
    if (settings.octaves <= 0 || settings.octaves > terrain::HeightField::kMaxOctaves)
    {
        std::ostringstream problem;
        problem << "must be in [1, " << terrain::HeightField::kMaxOctaves << ']';
        throwConfigError("terrain", "octaves", sourceName, problem.str());
    }
    if (!std::isfinite(settings.amplitude) || !std::isfinite(settings.offset))
    {
        throwConfigError("terrain", "amplitude/offset", sourceName, "must be finite");
    }
    if (!std::isfinite(settings.gain) || !std::isfinite(settings.lacunarity))
    {
        throwConfigError("terrain", "gain/lacunarity", sourceName, "must be finite");
    }
}

void applyStreaming(const toml::table& streamingTable, StreamingSettings& settings, const std::string& sourceName)
{
    settings.renderDistance =
        readInt(streamingTable, "streaming", "render_distance", settings.renderDistance, sourceName);
    settings.workerThreads = readInt(streamingTable, "streaming", "worker_threads", settings.workerThreads, sourceName);
    settings.maxLoadsPerTick =
        readInt(streamingTable, "streaming", "max_loads_per_tick", settings.maxLoadsPerTick, sourceName);

    if (settings.renderDistance < 0 || settings.renderDistance > StreamingSettings::kMaxRenderDistance)
    {
        std::ostringstream problem;
        problem << "must be in [0, " << StreamingSettings::kMaxRenderDistance << ']';
        throwConfigError("streaming", "render_distance", sourceName, problem.str());
    }
    if (settings.workerThreads < 0 || settings.workerThreads > StreamingSettings::kMaxWorkerThreads)
    {
        std::ostringstream problem;
        problem << "must be in [0, " << StreamingSettings::kMaxWorkerThreads << ']';
        throwConfigError("streaming", "worker_threads", sourceName, problem.str());
    }
    if (settings.maxLoadsPerTick < 0)
    {
        throwConfigError("streaming", "max_loads_per_tick", sourceName, "must be non-negative");
    }

    if (auto evictionName = streamingTable["eviction"].value<std::string>())
    {
        auto policy = parseEvictionPolicy(*evictionName);
        if (!policy)
        {
            throwConfigError("streaming", "eviction", sourceName, "must be one of \"retain\", \"evict\" or \"lru\"");
        }
        settings.eviction = *policy;
    }

    if (auto bound = streamingTable["max_resident_chunks"].value<std::int64_t>())
    {
        if (*bound < 0)
        {
            throwConfigError("streaming", "max_resident_chunks", sourceName, "must be non-negative");
        }
        settings.maxResidentChunks = static_cast<std::size_t>(*bound);
    }

    if (settings.eviction == EvictionPolicy::LeastRecentlyUsed && settings.maxResidentChunks == 0)
    {
        throwConfigError("streaming", "max_resident_chunks", sourceName, "must be positive when eviction is \"lru\"");
    }
}

void applyObserver(const toml::table& observerTable, ObserverSettings& settings, const std::string& sourceName)
{
    settings.moveSpeed = readFloat(observerTable, "move_speed", settings.moveSpeed);
    settings.mouseSensitivity = readFloat(observerTable, "mouse_sensitivity", settings.mouseSensitivity);

    if (!std::isfinite(settings.moveSpeed) || settings.moveSpeed < 0.0f)
    {
        throwConfigError("observer", "move_speed", sourceName, "must be non-negative and finite");
    }

    if (const toml::node* spawnNode = observerTable.get("spawn"))
    {
        const toml::array* spawn = spawnNode->as_array();
        if (!spawn || spawn->size() != 3)
        {
            throwConfigError("observer", "spawn", sourceName, "must be an array of three numbers");
        }
        for (std::size_t i = 0; i < 3; ++i)
        {
            auto component = (*spawn)[i].value<double>();
            if (!component || !std::isfinite(*component))
            {
                throwConfigError("observer", "spawn", sourceName, "must be an array of three numbers");
            }
            settings.spawn[static_cast<glm::length_t>(i)] = static_cast<float>(*component);
        }
    }
}

WorldConfig fromTable(const toml::table& table, const std::string& sourceName)
{
    WorldConfig config{};

    if (auto seedValue = table["seed"].value<std::int64_t>())
    {
        if (*seedValue < 0 || *seedValue > static_cast<std::int64_t>(std::numeric_limits<unsigned>::max()))
        {
            std::ostringstream oss;
            oss << "Seed value out of range in " << sourceName;
            throw std::runtime_error(oss.str());
        }
        config.seed = static_cast<unsigned>(*seedValue);
    }

    if (const toml::table* terrainTable = table["terrain"].as_table())
    {
        applyTerrain(*terrainTable, config.terrain, sourceName);
    }

    if (const toml::table* streamingTable = table["streaming"].as_table())
    {
        applyStreaming(*streamingTable, config.streaming, sourceName);
    }

    if (const toml::table* mesherTable = table["mesher"].as_table())
    {
        if (auto strategyName = (*mesherTable)["strategy"].value<std::string>())
        {
            auto strategy = parseMeshStrategy(*strategyName);
            if (!strategy)
            {
                throwConfigError("mesher", "strategy", sourceName, "must be one of \"naive\", \"culled\" or \"greedy\"");
            }
            config.mesher = *strategy;
        }
    }

    if (const toml::table* observerTable = table["observer"].as_table())
    {
        applyObserver(*observerTable, config.observer, sourceName);
    }

    return config;
}

} // namespace

std::optional<EvictionPolicy> parseEvictionPolicy(std::string_view name) noexcept
{
    if (name == "retain")
    {
        return EvictionPolicy::Retain;
    }
    if (name == "evict")
    {
        return EvictionPolicy::Evict;
    }
    if (name == "lru")
    {
        return EvictionPolicy::LeastRecentlyUsed;
    }
    return std::nullopt;
}

const char* toString(EvictionPolicy policy) noexcept
{
    switch (policy)
    {
    case EvictionPolicy::Retain:
        return "retain";
    case EvictionPolicy::Evict:
        return "evict";
    case EvictionPolicy::LeastRecentlyUsed:
        return "lru";
    }
    return "unknown";
}

WorldConfig WorldConfig::load(const std::filesystem::path& path)
{
    if (!std::filesystem::exists(path))
    {
        std::cout << "[WorldConfig] " << path << " not found, using defaults" << std::endl;
        return WorldConfig{};
    }

    toml::table table = toml::parse_file(path.string());
    WorldConfig config = fromTable(table, path.string());
    std::cout << "[WorldConfig] Loaded " << path << " (seed " << config.seed
              << ", render distance " << config.streaming.renderDistance
              << ", mesher " << toString(config.mesher) << ")" << std::endl;
    return config;
}

WorldConfig WorldConfig::parse(std::string_view document, const std::string& sourceName)
{
    toml::table table = toml::parse(document, sourceName);
    return fromTable(table, sourceName);
}
