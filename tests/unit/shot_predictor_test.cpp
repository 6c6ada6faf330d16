#include <gtest/gtest.h>

#include <limits>

#include "poolshot/core/constants.hpp"
#include "poolshot/core/shot_predictor.hpp"
#include "poolshot/trajectory/post_processing.hpp"

using namespace Trajectory;

class ShotPredictorTest : public ::testing::Test {
protected:
    TrajectorySimulator simulator;
    Position cueBall{75.0, 75.0};
    ShotPredictor predictor{simulator, cueBall, 300.0, 150.0};

    LaunchRequest requestFor(double force, double angle) const {
        LaunchRequest request;
        request.origin = cueBall;
        request.angleInDegrees = angle;
        request.force = force;
        request.tableWidth = 300.0;
        request.tableHeight = 150.0;
        request.maxBounces = SimulatorConstants::GuideLineMaxBounces;
        return request;
    }
};

TEST_F(ShotPredictorTest, StartsEmpty) {
    EXPECT_FALSE(predictor.hasPrediction());
    EXPECT_TRUE(predictor.current().path.empty());
    EXPECT_FALSE(predictor.current().endPoint.has_value());
}

TEST_F(ShotPredictorTest, WeakPullShowsNoGuideLine) {
    EXPECT_TRUE(predictor.update(3.0, 20.0).path.empty());
    EXPECT_TRUE(predictor.update(SimulatorConstants::MinimumGuideForce, 20.0).path.empty());
    EXPECT_FALSE(predictor.hasPrediction());
}

TEST_F(ShotPredictorTest, PredictionMatchesSimulator) {
    const GuidePrediction &prediction = predictor.update(60.0, 25.0);
    SimulationResult expected = simulator.simulateDetailed(requestFor(60.0, 25.0));

    ASSERT_TRUE(predictor.hasPrediction());
    EXPECT_EQ(prediction.path, expected.path);
    EXPECT_EQ(prediction.path.front(), cueBall);
    ASSERT_TRUE(prediction.endPoint.has_value());
    EXPECT_EQ(*prediction.endPoint, expected.path.back());
    EXPECT_EQ(prediction.bouncePoints, extractBouncePoints(expected.path));
    EXPECT_EQ(prediction.contactCount, expected.bounces);
    EXPECT_LE(prediction.contactCount, SimulatorConstants::GuideLineMaxBounces);
    EXPECT_EQ(prediction.termination, expected.termination);
}

TEST_F(ShotPredictorTest, LatestUpdateWins) {
    predictor.update(60.0, 25.0);
    predictor.update(80.0, -120.0);

    EXPECT_EQ(predictor.current().path, simulator.simulate(requestFor(80.0, -120.0)));

    // Dropping below the threshold clears the previous line
    predictor.update(0.0, -120.0);
    EXPECT_FALSE(predictor.hasPrediction());
    EXPECT_TRUE(predictor.current().bouncePoints.empty());
}

TEST_F(ShotPredictorTest, ClearAndMoveDropThePrediction) {
    predictor.update(60.0, 0.0);
    ASSERT_TRUE(predictor.hasPrediction());
    predictor.clear();
    EXPECT_FALSE(predictor.hasPrediction());

    predictor.update(60.0, 0.0);
    predictor.setCueBall(Position(200.0, 40.0));
    EXPECT_FALSE(predictor.hasPrediction());

    EXPECT_EQ(predictor.update(60.0, 0.0).path.front(), Position(200.0, 40.0));
}

TEST_F(ShotPredictorTest, NonFiniteAngleClearsTheLine) {
    predictor.update(60.0, 0.0);
    predictor.update(60.0, std::numeric_limits<double>::quiet_NaN());
    EXPECT_FALSE(predictor.hasPrediction());
    EXPECT_EQ(predictor.current().termination, StopReason::InvalidInput);
}
