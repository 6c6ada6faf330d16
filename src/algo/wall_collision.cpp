#include "poolshot/algo/wall_collision.hpp"

#include <cmath>

WallCollision resolveWallStep([[maybe_unused]] const Position &current,
                              const Position &proposed, const Vector &velocity,
                              double width, double height, double radius) {
    WallCollision result;
    result.point = proposed;
    result.velocity = velocity;

    // Left / right rails
    if (proposed.x - radius <= 0) {
        result.point.x = radius;
        result.velocity.x = std::abs(velocity.x);
        result.hitVertical = true;
    } else if (proposed.x + radius >= width) {
        result.point.x = width - radius;
        result.velocity.x = -std::abs(velocity.x);
        result.hitVertical = true;
    }

    // Top / bottom rails
    if (proposed.y - radius <= 0) {
        result.point.y = radius;
        result.velocity.y = std::abs(velocity.y);
        result.hitHorizontal = true;
    } else if (proposed.y + radius >= height) {
        result.point.y = height - radius;
        result.velocity.y = -std::abs(velocity.y);
        result.hitHorizontal = true;
    }

    result.collided = result.hitVertical || result.hitHorizontal;
    return result;
}
