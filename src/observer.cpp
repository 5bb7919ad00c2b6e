#include "observer.h"

#include <algorithm>
#include <cmath>

#include "chunk_coords.h"
#include "collision_query.h"

const glm::vec3& Observer::front() const noexcept
{
    return front_;
}

const glm::vec3& Observer::right() const noexcept
{
    return right_;
}

void Observer::processMouse(float xoffset, float yoffset)
{
    xoffset *= mouseSensitivity;
    yoffset *= mouseSensitivity;

    yaw += xoffset;
    pitch += yoffset;
    pitch = std::clamp(pitch, -89.0f, 89.0f);
    updateVectors();
}

void Observer::updateVectors()
{
    const float yawRad = glm::radians(yaw);
    const float pitchRad = glm::radians(pitch);

    glm::vec3 direction;
    direction.x = std::cos(yawRad) * std::cos(pitchRad);
    direction.y = std::sin(pitchRad);
    direction.z = std::sin(yawRad) * std::cos(pitchRad);
    front_ = glm::normalize(direction);

    glm::vec3 rightCandidate = glm::cross(front_, worldUp_);
    if (glm::length(rightCandidate) < kEpsilon)
    {
        rightCandidate = glm::vec3(1.0f, 0.0f, 0.0f);
    }
    else
    {
        rightCandidate = glm::normalize(rightCandidate);
    }
    right_ = rightCandidate;
}

glm::vec3 Observer::movementDirection(const MovementInput& input) const noexcept
{
    glm::vec3 direction{0.0f};
    if (input.forward)
    {
        direction += front_;
    }
    if (input.back)
    {
        direction -= front_;
    }
    if (input.right)
    {
        direction += right_;
    }
    if (input.left)
    {
        direction -= right_;
    }
    if (input.up)
    {
        direction += worldUp_;
    }
    if (input.down)
    {
        direction -= worldUp_;
    }

    const float lengthSq = glm::dot(direction, direction);
    if (lengthSq < kEpsilon * kEpsilon)
    {
        return glm::vec3(0.0f);
    }
    return direction / std::sqrt(lengthSq);
}

bool Observer::integrate(const MovementInput& input, float dt, const CollisionQuery& collision)
{
    const glm::vec3 direction = movementDirection(input);
    if (direction == glm::vec3(0.0f) || dt <= 0.0f)
    {
        return false;
    }

    const glm::vec3 candidate = position + direction * moveSpeed * dt;
    if (!isWithinWorldBounds(candidate) || collision.isSolid(candidate))
    {
        return false;
    }

    position = candidate;
    return true;
}
