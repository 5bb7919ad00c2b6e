#include <cmath>

#include <gtest/gtest.h>

#include "chunk_coords.h"
#include "chunk_store.h"
#include "collision_query.h"
#include "observer.h"
#include "terrain/terrain_generator.h"
#include "test_support.h"

namespace
{
struct ObserverFixture : ::testing::Test
{
    ObserverFixture()
        : flat(4),
          generator(flat.generator()),
          store(generator),
          collision(store)
    {
        store.getOrGenerate(glm::ivec3(0, 0, 0));
        observer.position = glm::vec3(8.5f, 4.5f, 8.5f);
        observer.moveSpeed = 2.0f;
        observer.yaw = 0.0f; // facing +X
        observer.updateVectors();
    }

    test_support::FlatTerrain flat;
    terrain::TerrainGenerator generator;
    ChunkStore store;
    CollisionQuery collision;
    Observer observer;
};
} // namespace

TEST_F(ObserverFixture, MovesThroughEmptySpace)
{
    MovementInput input{};
    input.forward = true;

    EXPECT_TRUE(observer.integrate(input, 0.5f, collision));
    EXPECT_NEAR(observer.position.x, 9.5f, 1e-5f);
    EXPECT_NEAR(observer.position.y, 4.5f, 1e-5f);
}

TEST_F(ObserverFixture, SolidCandidateRejectsMove)
{
    MovementInput input{};
    input.down = true;

    const glm::vec3 start = observer.position;
    EXPECT_FALSE(observer.integrate(input, 0.5f, collision));
    EXPECT_EQ(observer.position, start);
}

TEST_F(ObserverFixture, DiagonalInputIsNormalised)
{
    MovementInput input{};
    input.forward = true;
    input.right = true;

    const glm::vec3 start = observer.position;
    ASSERT_TRUE(observer.integrate(input, 1.0f, collision));
    EXPECT_NEAR(glm::length(observer.position - start), observer.moveSpeed, 1e-4f);
}

TEST_F(ObserverFixture, OpposingInputsDoNotMove)
{
    MovementInput input{};
    input.forward = true;
    input.back = true;

    EXPECT_FALSE(observer.integrate(input, 1.0f, collision));
}

TEST(ObserverTest, PitchIsClamped)
{
    Observer observer;
    observer.mouseSensitivity = 1.0f;
    observer.processMouse(0.0f, 500.0f);
    EXPECT_FLOAT_EQ(observer.pitch, 89.0f);
    observer.processMouse(0.0f, -1000.0f);
    EXPECT_FLOAT_EQ(observer.pitch, -89.0f);
    EXPECT_NEAR(glm::length(observer.front()), 1.0f, 1e-5f);
}

TEST_F(ObserverFixture, MoveLeavingWorldBoundsIsRefused)
{
    MovementInput input{};
    input.forward = true;

    observer.position = glm::vec3(kMaxWorldExtent, 4.5f, 8.5f);
    observer.moveSpeed = 1000.0f;
    const glm::vec3 start = observer.position;
    EXPECT_FALSE(observer.integrate(input, 1.0f, collision));
    EXPECT_EQ(observer.position, start);
}
