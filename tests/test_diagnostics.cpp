#include <gtest/gtest.h>
#include "physics/Diagnostics.hpp"
#include "physics/Constants.hpp"

#include <cmath>
#include <numbers>

using namespace orrery;

namespace {

Body makeBody(const std::string& name, Vec2d x, Vec2d v, double m) {
    Body b;
    b.name = name;
    b.x = x;
    b.v = v;
    b.m = m;
    return b;
}

constexpr double kSunMass   = 1.989e30;
constexpr double kEarthMass = 5.972e24;
constexpr double kEarthDist = 1.496e11;

/// Sun and Earth on a circular relative orbit with zero net momentum.
System sunEarth(double dt) {
    double mu = G * (kSunMass + kEarthMass);
    double speed = std::sqrt(mu / kEarthDist);
    // Split the relative velocity so the centre of mass is at rest
    double earthSpeed = speed * kSunMass / (kSunMass + kEarthMass);
    double sunSpeed = -speed * kEarthMass / (kSunMass + kEarthMass);

    auto system = System::create({
        makeBody("sun",   {0.0, 0.0},        {sunSpeed, 0.0},   kSunMass),
        makeBody("earth", {0.0, kEarthDist}, {earthSpeed, 0.0}, kEarthMass),
    }, dt);
    return std::move(*system);
}

double orbitalPeriod() {
    double mu = G * (kSunMass + kEarthMass);
    return 2.0 * std::numbers::pi * std::sqrt(kEarthDist * kEarthDist * kEarthDist / mu);
}

} // namespace

// =============================================================================
// Instantaneous quantities
// =============================================================================

TEST(DiagnosticsTest, MomentumSums) {
    auto system = System::create({
        makeBody("a", {0.0, 0.0}, {1.0, 2.0},  10.0),
        makeBody("b", {5.0, 0.0}, {-3.0, 0.5}, 4.0),
    }, 1.0);
    ASSERT_TRUE(system.has_value());

    Vec2d p = totalMomentum(*system);
    EXPECT_DOUBLE_EQ(p.x, 10.0 - 12.0);
    EXPECT_DOUBLE_EQ(p.y, 20.0 + 2.0);
}

TEST(DiagnosticsTest, EnergyOfPairAtRest) {
    auto system = System::create({
        makeBody("heavy", {0.0, 0.0},  {}, 1e30),
        makeBody("light", {1e11, 0.0}, {}, 1e24),
    }, 60.0);
    ASSERT_TRUE(system.has_value());

    auto q = measure(*system);
    EXPECT_DOUBLE_EQ(q.kineticEnergy, 0.0);
    double expected = -G * 1e30 * 1e24 / 1e11;
    EXPECT_NEAR(q.potentialEnergy, expected, 1e-12 * std::abs(expected));
    EXPECT_DOUBLE_EQ(q.totalEnergy(), q.potentialEnergy);
    EXPECT_DOUBLE_EQ(totalEnergy(*system), q.totalEnergy());
}

TEST(DiagnosticsTest, KineticEnergy) {
    auto system = System::create({makeBody("solo", {}, {3.0, 4.0}, 2.0)}, 1.0);
    ASSERT_TRUE(system.has_value());
    EXPECT_DOUBLE_EQ(measure(*system).kineticEnergy, 0.5 * 2.0 * 25.0);
}

TEST(DiagnosticsTest, AngularMomentumSign) {
    // Moving +x while sitting on +y is clockwise: negative z
    auto system = System::create({makeBody("solo", {0.0, 2.0}, {3.0, 0.0}, 5.0)}, 1.0);
    ASSERT_TRUE(system.has_value());
    EXPECT_DOUBLE_EQ(totalAngularMomentum(*system), -2.0 * 3.0 * 5.0);
}

TEST(DiagnosticsTest, CenterOfMass) {
    auto system = System::create({
        makeBody("a", {0.0, 0.0},  {}, 3.0),
        makeBody("b", {4.0, 8.0},  {}, 1.0),
    }, 1.0);
    ASSERT_TRUE(system.has_value());

    Vec2d com = centerOfMass(*system);
    EXPECT_DOUBLE_EQ(com.x, 1.0);
    EXPECT_DOUBLE_EQ(com.y, 2.0);
}

TEST(DiagnosticsTest, RelativeDrift) {
    EXPECT_DOUBLE_EQ(relativeDrift(100.0, 101.0), 0.01);
    EXPECT_DOUBLE_EQ(relativeDrift(-100.0, -99.0), 0.01);
    EXPECT_DOUBLE_EQ(relativeDrift(5.0, 5.0), 0.0);
    EXPECT_DOUBLE_EQ(relativeDrift(0.0, 0.25), 0.25);
}

// =============================================================================
// Closed two-body orbit over one period
// =============================================================================

class SunEarthOrbitTest : public ::testing::Test {
protected:
    static constexpr double kTimeStep = 600.0;

    void SetUp() override {
        system.emplace(sunEarth(kTimeStep));
        before = measure(*system);
        system->advance(static_cast<uint64_t>(orbitalPeriod() / kTimeStep));
        after = measure(*system);
    }

    std::optional<System> system;
    ConservedQuantities before;
    ConservedQuantities after;
};

TEST_F(SunEarthOrbitTest, MomentumConservedToRounding) {
    double scale = kEarthMass * 3e4;
    EXPECT_NEAR(after.momentum.x, before.momentum.x, 1e-9 * scale);
    EXPECT_NEAR(after.momentum.y, before.momentum.y, 1e-9 * scale);
}

TEST_F(SunEarthOrbitTest, CenterOfMassStaysPut) {
    Vec2d com = centerOfMass(*system);
    Vec2d expected(0.0, kEarthDist * kEarthMass / (kSunMass + kEarthMass));
    EXPECT_NEAR(com.x, expected.x, 1e-6 * kEarthDist);
    EXPECT_NEAR(com.y, expected.y, 1e-6 * kEarthDist);
}

TEST_F(SunEarthOrbitTest, EnergyDriftBounded) {
    EXPECT_LT(relativeDrift(before.totalEnergy(), after.totalEnergy()), 0.01);
}

TEST_F(SunEarthOrbitTest, EnergyGrowsUnderForwardEuler) {
    // The orbit spirals outward: first-order integration is not symplectic
    EXPECT_GT(after.totalEnergy(), before.totalEnergy());
}

TEST_F(SunEarthOrbitTest, AngularMomentumDriftBounded) {
    EXPECT_LT(relativeDrift(before.angularMomentum, after.angularMomentum), 0.01);
}

TEST_F(SunEarthOrbitTest, ReturnsNearStart) {
    const Body* earth = system->find("earth");
    ASSERT_NE(earth, nullptr);
    // Within a few percent of an orbit's circumference
    EXPECT_LT(Vec2d::distance(earth->x, {0.0, kEarthDist}), 0.05 * 2.0 * std::numbers::pi * kEarthDist);
}
