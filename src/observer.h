#pragma once

#include <glm/glm.hpp>

class CollisionQuery;

inline constexpr float kEpsilon = 1e-6f;

struct MovementInput
{
    bool forward{false};
    bool back{false};
    bool left{false};
    bool right{false};
    bool up{false};
    bool down{false};
};

class Observer
{
public:
    glm::vec3 position{0.0f, 50.0f, 0.0f};
    float yaw{-90.0f};
    float pitch{0.0f};
    float moveSpeed{5.0f};
    float mouseSensitivity{0.12f};

    const glm::vec3& front() const noexcept;
    const glm::vec3& right() const noexcept;

    void processMouse(float xoffset, float yoffset);
    void updateVectors();

    // Unit direction for the given intents, or zero when they cancel out.
    glm::vec3 movementDirection(const MovementInput& input) const noexcept;

    // Commits position + direction * moveSpeed * dt unless the candidate point is solid
    // or outside the world bounds.
    bool integrate(const MovementInput& input, float dt, const CollisionQuery& collision);

private:
    glm::vec3 front_{0.0f, 0.0f, -1.0f};
    glm::vec3 right_{1.0f, 0.0f, 0.0f};
    glm::vec3 worldUp_{0.0f, 1.0f, 0.0f};
};
