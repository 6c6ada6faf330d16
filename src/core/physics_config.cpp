#include "poolshot/core/physics_config.hpp"

#include <cmath>
#include <stdexcept>
#include <string>

PhysicsConfig PhysicsConfig::defaults() {
    PhysicsConfig cfg{};
    cfg.ballRadius        = 8.0;
    cfg.friction          = 0.985;  // 1.5% loss per step
    cfg.minVelocity       = 0.3;
    cfg.timeStep          = 0.08;
    cfg.maxPoints         = 300;
    cfg.velocityScale     = 0.15;
    cfg.bounceRestitution = 0.92;   // 8% loss per bounce
    return cfg;
}

namespace {

void require(bool ok, const std::string& field, double value) {
    if (!ok) {
        throw std::invalid_argument("PhysicsConfig: invalid " + field + " (" +
                                    std::to_string(value) + ")");
    }
}

} // namespace

void validatePhysicsConfig(const PhysicsConfig& cfg) {
    require(std::isfinite(cfg.ballRadius) && cfg.ballRadius > 0.0,
            "ballRadius", cfg.ballRadius);
    require(std::isfinite(cfg.friction) && cfg.friction > 0.0 && cfg.friction < 1.0,
            "friction", cfg.friction);
    require(std::isfinite(cfg.minVelocity) && cfg.minVelocity >= 0.0,
            "minVelocity", cfg.minVelocity);
    require(std::isfinite(cfg.timeStep) && cfg.timeStep > 0.0,
            "timeStep", cfg.timeStep);
    require(cfg.maxPoints > 0, "maxPoints", cfg.maxPoints);
    require(std::isfinite(cfg.velocityScale) && cfg.velocityScale > 0.0,
            "velocityScale", cfg.velocityScale);
    require(std::isfinite(cfg.bounceRestitution) && cfg.bounceRestitution > 0.0 &&
                cfg.bounceRestitution <= 1.0,
            "bounceRestitution", cfg.bounceRestitution);
}
