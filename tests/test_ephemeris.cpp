#include <gtest/gtest.h>
#include "ephemeris/BuiltinEphemeris.hpp"
#include "ephemeris/JsonEphemeris.hpp"
#include "physics/Constants.hpp"

#include <algorithm>
#include <cstdio>
#include <fstream>

using namespace orrery;
using json = nlohmann::json;

namespace {

const std::string kEpoch = "2022-01-01 00:00:00";

/// Provider backed by a fixed list, for layering tests.
class FixedEphemeris : public IEphemerisProvider {
public:
    explicit FixedEphemeris(std::vector<Body> bodies, std::string label = "fixed")
        : m_bodies(std::move(bodies)), m_label(std::move(label)) {}

    std::optional<Body> lookup(const std::string& name, const std::string&) const override {
        for (const auto& body : m_bodies) {
            if (body.name == name) return body;
        }
        return std::nullopt;
    }
    std::string describe() const override { return m_label; }

private:
    std::vector<Body> m_bodies;
    std::string m_label;
};

Body namedBody(const std::string& name, double y, const std::string& color = "white") {
    Body b;
    b.name = name;
    b.color = color;
    b.x = {0.0, y};
    b.m = 1e20;
    return b;
}

} // namespace

// =============================================================================
// Built-in constants
// =============================================================================

TEST(BuiltinEphemerisTest, CatalogueHasTenBodies) {
    const auto& catalog = BuiltinEphemeris::catalog();
    ASSERT_EQ(catalog.size(), 10u);
    EXPECT_EQ(catalog.front().name, "sun");
    EXPECT_EQ(catalog.back().name, "pluto");

    auto names = BuiltinEphemeris::defaultBodyNames();
    ASSERT_EQ(names.size(), 10u);
    EXPECT_EQ(names[3], "earth");
}

TEST(BuiltinEphemerisTest, CatalogueIsValid) {
    for (const auto& body : BuiltinEphemeris::catalog()) {
        SCOPED_TRACE(body.name);
        EXPECT_TRUE(body.validate().empty());
    }
}

TEST(BuiltinEphemerisTest, SunAtRestAtOrigin) {
    BuiltinEphemeris eph;
    auto sun = eph.lookup("sun", kEpoch);
    ASSERT_TRUE(sun.has_value());
    EXPECT_EQ(sun->x, Vec2d(0.0, 0.0));
    EXPECT_EQ(sun->v, Vec2d(0.0, 0.0));
    EXPECT_DOUBLE_EQ(sun->m, 1.989e30);
    EXPECT_DOUBLE_EQ(sun->r, 696340e3);
    EXPECT_EQ(sun->color, "yellow");
}

TEST(BuiltinEphemerisTest, PlanetsStartOnPositiveYMovingPositiveX) {
    BuiltinEphemeris eph;
    for (const auto& name : BuiltinEphemeris::defaultBodyNames()) {
        if (name == "sun") continue;
        SCOPED_TRACE(name);
        auto body = eph.lookup(name, kEpoch);
        ASSERT_TRUE(body.has_value());
        EXPECT_DOUBLE_EQ(body->x.x, 0.0);
        EXPECT_GT(body->x.y, 0.0);
        EXPECT_GT(body->v.x, 0.0);
        EXPECT_DOUBLE_EQ(body->v.y, 0.0);
    }
}

TEST(BuiltinEphemerisTest, Earth) {
    BuiltinEphemeris eph;
    auto earth = eph.lookup("earth", kEpoch);
    ASSERT_TRUE(earth.has_value());
    EXPECT_DOUBLE_EQ(earth->x.y, 149598261e3);
    EXPECT_DOUBLE_EQ(earth->v.x, 30000.0);
    EXPECT_DOUBLE_EQ(earth->m, 5.972e24);
    EXPECT_EQ(earth->color, "blue");
}

TEST(BuiltinEphemerisTest, IgnoresEpoch) {
    BuiltinEphemeris eph;
    auto a = eph.lookup("mars", kEpoch);
    auto b = eph.lookup("mars", "1999-12-31 23:59:59");
    ASSERT_TRUE(a && b);
    EXPECT_EQ(a->x, b->x);
}

TEST(BuiltinEphemerisTest, UnknownBody) {
    BuiltinEphemeris eph;
    EXPECT_FALSE(eph.lookup("vulcan", kEpoch).has_value());
    EXPECT_FALSE(eph.lookup("Earth", kEpoch).has_value());
}

// =============================================================================
// JSON tables
// =============================================================================

TEST(JsonEphemerisTest, UnitFactors) {
    EXPECT_DOUBLE_EQ(*JsonEphemeris::lengthFactor("au"), AU);
    EXPECT_DOUBLE_EQ(*JsonEphemeris::lengthFactor("km"), 1e3);
    EXPECT_DOUBLE_EQ(*JsonEphemeris::lengthFactor("m"), 1.0);
    EXPECT_FALSE(JsonEphemeris::lengthFactor("parsec").has_value());

    EXPECT_DOUBLE_EQ(*JsonEphemeris::timeFactor("day"), DAY);
    EXPECT_DOUBLE_EQ(*JsonEphemeris::timeFactor("s"), 1.0);
    EXPECT_FALSE(JsonEphemeris::timeFactor("year").has_value());
}

TEST(JsonEphemerisTest, AuPerDayConvertedToSi) {
    auto eph = JsonEphemeris::fromJson(json::parse(R"({
        "units": {"length": "au", "time": "day"},
        "epochs": {
            "2022-01-01 00:00:00": {
                "earth": {"x": -0.17, "y": 0.97, "vx": -0.0172, "vy": -0.003,
                          "radius": 6371, "mass": 5.972e24, "color": "blue"}
            }
        }
    })"));
    ASSERT_TRUE(eph.has_value());

    auto earth = eph->lookup("earth", kEpoch);
    ASSERT_TRUE(earth.has_value());
    EXPECT_DOUBLE_EQ(earth->x.x, -0.17 * AU);
    EXPECT_DOUBLE_EQ(earth->x.y, 0.97 * AU);
    EXPECT_NEAR(earth->v.x, -0.0172 * AU / DAY, 1e-9);
    EXPECT_NEAR(earth->v.y, -0.003 * AU / DAY, 1e-9);
    // Radius is in km alongside au positions
    EXPECT_DOUBLE_EQ(earth->r, 6371e3);
    EXPECT_DOUBLE_EQ(earth->m, 5.972e24);
    EXPECT_EQ(earth->color, "blue");
}

TEST(JsonEphemerisTest, MetresKeepRadiusInMetres) {
    auto eph = JsonEphemeris::fromJson(json::parse(R"({
        "units": {"length": "m", "time": "s"},
        "epochs": {"t0": {"rock": {"x": 1, "y": 2, "vx": 3, "vy": 4, "radius": 500, "mass": 1e10}}}
    })"));
    ASSERT_TRUE(eph.has_value());

    auto rock = eph->lookup("rock", "t0");
    ASSERT_TRUE(rock.has_value());
    EXPECT_EQ(rock->x, Vec2d(1.0, 2.0));
    EXPECT_EQ(rock->v, Vec2d(3.0, 4.0));
    EXPECT_DOUBLE_EQ(rock->r, 500.0);
}

TEST(JsonEphemerisTest, DefaultsToSiWithoutUnits) {
    auto eph = JsonEphemeris::fromJson(json::parse(R"({
        "epochs": {"t0": {"rock": {"x": 7, "y": 0, "vx": 0, "vy": 0, "mass": 1}}}
    })"));
    ASSERT_TRUE(eph.has_value());

    auto rock = eph->lookup("rock", "t0");
    ASSERT_TRUE(rock.has_value());
    EXPECT_DOUBLE_EQ(rock->x.x, 7.0);
    EXPECT_DOUBLE_EQ(rock->r, 0.0);
    EXPECT_EQ(rock->color, "white");
}

TEST(JsonEphemerisTest, MissingEpochOrBody) {
    auto eph = JsonEphemeris::fromJson(json::parse(R"({
        "epochs": {"t0": {"rock": {"x": 1, "y": 0, "vx": 0, "vy": 0, "mass": 1}}}
    })"));
    ASSERT_TRUE(eph.has_value());

    EXPECT_FALSE(eph->lookup("rock", "t1").has_value());
    EXPECT_FALSE(eph->lookup("pebble", "t0").has_value());
}

TEST(JsonEphemerisTest, EpochsSorted) {
    auto eph = JsonEphemeris::fromJson(json::parse(R"({
        "epochs": {"2023-01-01": {}, "2021-06-01": {}, "2022-01-01": {}}
    })"));
    ASSERT_TRUE(eph.has_value());

    auto epochs = eph->epochs();
    ASSERT_EQ(epochs.size(), 3u);
    EXPECT_EQ(epochs[0], "2021-06-01");
    EXPECT_EQ(epochs[2], "2023-01-01");
}

TEST(JsonEphemerisTest, RejectsUnknownUnits) {
    EXPECT_FALSE(JsonEphemeris::fromJson(json::parse(R"({
        "units": {"length": "lightyear"}, "epochs": {}
    })")).has_value());
    EXPECT_FALSE(JsonEphemeris::fromJson(json::parse(R"({
        "units": {"time": "fortnight"}, "epochs": {}
    })")).has_value());
}

TEST(JsonEphemerisTest, RejectsMissingEpochs) {
    EXPECT_FALSE(JsonEphemeris::fromJson(json::parse(R"({"units": {}})")).has_value());
    EXPECT_FALSE(JsonEphemeris::fromJson(json::parse("[1, 2]")).has_value());
}

TEST(JsonEphemerisTest, RejectsMalformedEntry) {
    // vx is a string, mass missing
    EXPECT_FALSE(JsonEphemeris::fromJson(json::parse(R"({
        "epochs": {"t0": {"rock": {"x": 1, "y": 0, "vx": "fast", "vy": 0, "mass": 1}}}
    })")).has_value());
    EXPECT_FALSE(JsonEphemeris::fromJson(json::parse(R"({
        "epochs": {"t0": {"rock": {"x": 1, "y": 0, "vx": 0, "vy": 0}}}
    })")).has_value());
    EXPECT_FALSE(JsonEphemeris::fromJson(json::parse(R"({
        "epochs": {"t0": {"rock": 42}}
    })")).has_value());
}

TEST(JsonEphemerisTest, NonStringColorFallsBack) {
    auto eph = JsonEphemeris::fromJson(json::parse(R"({
        "epochs": {"t0": {"rock": {"x": 1, "y": 0, "vx": 0, "vy": 0, "mass": 1, "color": 3}}}
    })"));
    ASSERT_TRUE(eph.has_value());
    EXPECT_EQ(eph->lookup("rock", "t0")->color, "white");
}

TEST(JsonEphemerisTest, MissingFile) {
    EXPECT_FALSE(JsonEphemeris::fromFile("/tmp/orrery_no_such_table.json").has_value());
}

TEST(JsonEphemerisTest, MalformedFile) {
    const std::string path = "/tmp/orrery_test_bad_table.json";
    {
        std::ofstream out(path);
        out << "{\"epochs\": ";
    }
    EXPECT_FALSE(JsonEphemeris::fromFile(path).has_value());
    std::remove(path.c_str());
}

TEST(JsonEphemerisTest, BundledTableMatchesBuiltin) {
    auto eph = JsonEphemeris::fromFile("data/circular_orbits.json");
    ASSERT_TRUE(eph.has_value());
    EXPECT_NE(eph->describe().find("circular_orbits.json"), std::string::npos);

    BuiltinEphemeris builtin;
    for (const auto& name : BuiltinEphemeris::defaultBodyNames()) {
        SCOPED_TRACE(name);
        auto fromFile = eph->lookup(name, kEpoch);
        auto fromConst = builtin.lookup(name, kEpoch);
        ASSERT_TRUE(fromFile.has_value());
        ASSERT_TRUE(fromConst.has_value());
        EXPECT_NEAR(fromFile->x.y, fromConst->x.y, 1e-6 * std::max(1.0, fromConst->x.y));
        EXPECT_NEAR(fromFile->v.x, fromConst->v.x, 1e-9 * std::max(1.0, fromConst->v.x));
        EXPECT_NEAR(fromFile->r, fromConst->r, 1e-6 * fromConst->r);
        EXPECT_DOUBLE_EQ(fromFile->m, fromConst->m);
        EXPECT_EQ(fromFile->color, fromConst->color);
    }
}

// =============================================================================
// Layering and bulk loading
// =============================================================================

TEST(LayeredEphemerisTest, PrimaryWins) {
    LayeredEphemeris eph(
        std::make_unique<FixedEphemeris>(std::vector<Body>{namedBody("earth", 1.0, "green")}),
        std::make_unique<BuiltinEphemeris>());

    auto earth = eph.lookup("earth", kEpoch);
    ASSERT_TRUE(earth.has_value());
    EXPECT_EQ(earth->color, "green");
    EXPECT_DOUBLE_EQ(earth->x.y, 1.0);
}

TEST(LayeredEphemerisTest, FallsBackForMissing) {
    LayeredEphemeris eph(
        std::make_unique<FixedEphemeris>(std::vector<Body>{namedBody("earth", 1.0)}),
        std::make_unique<BuiltinEphemeris>());

    auto sun = eph.lookup("sun", kEpoch);
    ASSERT_TRUE(sun.has_value());
    EXPECT_EQ(sun->color, "yellow");
    EXPECT_FALSE(eph.lookup("vulcan", kEpoch).has_value());
}

TEST(LayeredEphemerisTest, NullLayersTolerated) {
    LayeredEphemeris eph(nullptr, std::make_unique<BuiltinEphemeris>());
    EXPECT_TRUE(eph.lookup("sun", kEpoch).has_value());

    LayeredEphemeris empty(nullptr, nullptr);
    EXPECT_FALSE(empty.lookup("sun", kEpoch).has_value());
    EXPECT_EQ(empty.describe(), "none over none");
}

TEST(LayeredEphemerisTest, Describe) {
    LayeredEphemeris eph(std::make_unique<FixedEphemeris>(std::vector<Body>{}, "table"),
                         std::make_unique<BuiltinEphemeris>());
    EXPECT_EQ(eph.describe(), "table over built-in constants");
}

TEST(LoadBodiesTest, KeepsRequestedOrder) {
    BuiltinEphemeris eph;
    auto bodies = loadBodies(eph, {"earth", "sun", "mars"}, kEpoch);
    ASSERT_TRUE(bodies.has_value());
    ASSERT_EQ(bodies->size(), 3u);
    EXPECT_EQ((*bodies)[0].name, "earth");
    EXPECT_EQ((*bodies)[1].name, "sun");
    EXPECT_EQ((*bodies)[2].name, "mars");
}

TEST(LoadBodiesTest, FailsOnAnyMissing) {
    BuiltinEphemeris eph;
    EXPECT_FALSE(loadBodies(eph, {"sun", "vulcan", "earth", "nibiru"}, kEpoch).has_value());
}

TEST(LoadBodiesTest, EmptyRequest) {
    BuiltinEphemeris eph;
    auto bodies = loadBodies(eph, {}, kEpoch);
    ASSERT_TRUE(bodies.has_value());
    EXPECT_TRUE(bodies->empty());
}
