#ifndef POOLSHOT_COMPONENTS_BASIC_HPP
#define POOLSHOT_COMPONENTS_BASIC_HPP

#include "poolshot/math/vector_math.hpp" // for Position, Vector

namespace Components {

    // Use the Position and Vector classes from vector_math.hpp
    using Position = ::Position;
    using Velocity = ::Vector;

    struct Radius {
        double value;
    };

    // Where the ball would end up this step if nothing were in the way
    struct ProposedPosition {
        ::Position value;
    };

    // Rail contact bookkeeping for the ball.
    // A budget of zero means the first rail contact ends the path.
    struct WallContacts {
        int bounces = 0;
        int maxBounces = 0;
        bool collidedThisStep = false;
        bool blockedByBudget = false;
    };

    // Playing surface extents, rails excluded
    struct TableBounds {
        double width;
        double height;
    };

} // namespace Components

#endif
