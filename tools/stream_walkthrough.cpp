#include <cstdint>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <string>
#include <unordered_map>
#include <vector>

#include <glm/glm.hpp>

#include "chunk_store.h"
#include "collision_query.h"
#include "mesh_builder.h"
#include "observer.h"
#include "render_sink.h"
#include "streaming_controller.h"
#include "terrain/height_field.h"
#include "terrain/terrain_generator.h"
#include "world_config.h"

namespace
{

constexpr float kTickSeconds = 1.0f / 60.0f;
constexpr int kDefaultTicks = 600;
constexpr int kReportInterval = 60;

// Stands in for the host renderer: remembers live handles and their triangle counts.
class RecordingRenderSink final : public RenderSink
{
public:
    RenderHandle spawn(const MeshData& mesh, const glm::vec3& /*worldOffset*/) override
    {
        const RenderHandle handle = nextHandle_++;
        live_.emplace(handle, mesh.triangleCount());
        liveTriangles_ += mesh.triangleCount();
        ++spawns_;
        return handle;
    }

    void despawn(RenderHandle handle) override
    {
        auto it = live_.find(handle);
        if (it == live_.end())
        {
            std::cerr << "[Walkthrough] Despawn of unknown handle " << handle << std::endl;
            return;
        }
        liveTriangles_ -= it->second;
        live_.erase(it);
        ++despawns_;
    }

    std::size_t liveCount() const noexcept { return live_.size(); }
    std::size_t liveTriangles() const noexcept { return liveTriangles_; }
    std::uint64_t spawns() const noexcept { return spawns_; }
    std::uint64_t despawns() const noexcept { return despawns_; }

private:
    RenderHandle nextHandle_{1};
    std::unordered_map<RenderHandle, std::size_t> live_;
    std::size_t liveTriangles_{0};
    std::uint64_t spawns_{0};
    std::uint64_t despawns_{0};
};

struct TickRecord
{
    int tick{0};
    glm::vec3 position{0.0f};
    bool moved{false};
    StreamingStats stats{};
    std::size_t liveMeshes{0};
};

} // namespace

int main(int argc, char** argv)
{
    const std::filesystem::path configPath = argc > 1 ? std::filesystem::path(argv[1]) : std::filesystem::path("assets/world.toml");
    int ticks = kDefaultTicks;
    if (argc > 2)
    {
        try
        {
            ticks = std::stoi(argv[2]);
        }
        catch (const std::exception&)
        {
            std::cerr << "Tick count must be an integer, got '" << argv[2] << "'" << std::endl;
            return EXIT_FAILURE;
        }
        if (ticks < 0)
        {
            std::cerr << "Tick count must be non-negative" << std::endl;
            return EXIT_FAILURE;
        }
    }

    try
    {
        const WorldConfig config = WorldConfig::load(configPath);

        terrain::HeightField heightField(config.seed, config.terrain);
        terrain::TerrainGenerator generator(heightField);
        ChunkStore store(generator);
        MeshBuilder mesher(config.mesher);
        RecordingRenderSink sink;
        StreamingController controller(store, mesher, sink, config.streaming);
        CollisionQuery collision(store);

        Observer observer;
        observer.position = config.observer.spawn;
        observer.moveSpeed = config.observer.moveSpeed;
        observer.mouseSensitivity = config.observer.mouseSensitivity;
        observer.yaw = 0.0f;
        observer.updateVectors();

        MovementInput input{};
        input.forward = true;

        std::vector<TickRecord> records;
        records.reserve(static_cast<std::size_t>(ticks));
        int blockedTicks = 0;

        for (int tick = 0; tick < ticks; ++tick)
        {
            const bool moved = observer.integrate(input, kTickSeconds, collision);
            if (!moved)
            {
                ++blockedTicks;
            }
            controller.tick(observer.position);

            TickRecord record{};
            record.tick = tick;
            record.position = observer.position;
            record.moved = moved;
            record.stats = controller.stats();
            record.liveMeshes = sink.liveCount();
            records.push_back(record);

            if ((tick + 1) % kReportInterval == 0)
            {
                const StreamingStats& stats = record.stats;
                std::cout << "[Walkthrough] tick " << (tick + 1) << " pos (" << std::fixed << std::setprecision(2)
                          << observer.position.x << ", " << observer.position.y << ", " << observer.position.z
                          << ") loaded " << stats.loadedChunks << " resident " << stats.residentChunks
                          << " pending " << stats.pendingJobs << " triangles " << stats.loadedTriangles
                          << " gen " << std::setprecision(3) << stats.averageGenerationMs << "ms"
                          << " mesh " << stats.averageMeshingMs << "ms" << std::endl;
            }
        }

        controller.drain();
        controller.tick(observer.position);

        const char* csvPath = "stream_walkthrough.csv";
        std::ofstream out(csvPath, std::ios::trunc);
        if (!out)
        {
            std::cerr << "Failed to open " << csvPath << " for writing" << std::endl;
            return EXIT_FAILURE;
        }
        out << "tick,x,y,z,moved,chunk_x,chunk_y,chunk_z,loaded,resident,pending,triangles,"
               "generated,meshed,spawned,despawned,evicted,dropped,discarded,live_meshes\n";
        out << std::fixed << std::setprecision(4);
        for (const auto& record : records)
        {
            const StreamingStats& stats = record.stats;
            out << record.tick << ',' << record.position.x << ',' << record.position.y << ',' << record.position.z << ','
                << (record.moved ? 1 : 0) << ',' << stats.observerChunk.x << ',' << stats.observerChunk.y << ','
                << stats.observerChunk.z << ',' << stats.loadedChunks << ',' << stats.residentChunks << ','
                << stats.pendingJobs << ',' << stats.loadedTriangles << ',' << stats.generatedChunks << ','
                << stats.meshedChunks << ',' << stats.spawnedChunks << ',' << stats.despawnedChunks << ','
                << stats.evictedChunks << ',' << stats.droppedJobs << ',' << stats.discardedResults << ','
                << record.liveMeshes << '\n';
        }

        const StreamingStats finalStats = controller.stats();
        std::cout << "[Walkthrough] " << ticks << " ticks, " << blockedTicks << " blocked by terrain, "
                  << sink.spawns() << " spawns, " << sink.despawns() << " despawns, "
                  << finalStats.loadedChunks << " chunks loaded, " << sink.liveTriangles() << " live triangles"
                  << std::endl;
        std::cout << "Wrote " << records.size() << " ticks to " << csvPath << std::endl;
    }
    catch (const std::exception& ex)
    {
        std::cerr << "stream_walkthrough failed: " << ex.what() << std::endl;
        return EXIT_FAILURE;
    }

    return 0;
}
