// test_component_registry.cpp - Region registration, hit-testing and quadtree tests

#include <gtest/gtest.h>
#include "ui/ComponentRegistry.h"
#include "ui/SpatialIndex.h"
#include "TestDoubles.h"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/ostream_sink.h>
#include <random>
#include <sstream>
#include <stdexcept>

namespace TerminalMouse::UI {
namespace Tests {

using TerminalMouse::Tests::ManualClock;

namespace {

ClickableRegion MakeRegion(const std::string& id, RegionBounds bounds, int priority = 0) {
    ClickableRegion region;
    region.id = id;
    region.type = RegionType::Button;
    region.bounds = bounds;
    region.priority = priority;
    region.accessibility.label = id;
    return region;
}

} // namespace

class ComponentRegistryTest : public ::testing::Test {
protected:
    ComponentRegistryTest() {
        config.terminalWidth = 80;
        config.terminalHeight = 24;
    }

    ComponentRegistry& Registry() {
        if (!registry) {
            registry = std::make_unique<ComponentRegistry>(config, clock);
        }
        return *registry;
    }

    Core::RegistryConfig config;
    ManualClock clock;
    std::unique_ptr<ComponentRegistry> registry;
};

// ============================================================================
// Validation
// ============================================================================

TEST_F(ComponentRegistryTest, ValidRegionRegisters) {
    RegistrationResult result = Registry().Register(MakeRegion("ok", {0, 0, 5, 1}));

    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.error, RegistrationError::None);
    EXPECT_TRUE(result.errors.empty());
    EXPECT_TRUE(Registry().Has("ok"));
    EXPECT_EQ(Registry().Size(), 1u);
}

TEST_F(ComponentRegistryTest, ZeroWidthRejectedWithBoundsMessage) {
    RegistrationResult result = Registry().Register(MakeRegion("flat", {0, 0, 0, 1}));

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error, RegistrationError::Validation);
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_NE(result.errors[0].find("bounds"), std::string::npos);
    EXPECT_FALSE(Registry().Has("flat"));
}

TEST_F(ComponentRegistryTest, ValidationCollectsEveryError) {
    ClickableRegion region = MakeRegion("", {-1, 0, 3, 3}, 1001);
    region.accessibility.label.clear();
    region.accessibility.tabIndex = -2;

    ValidationResult result = ValidateRegion(region);

    EXPECT_FALSE(result.isValid);
    ASSERT_EQ(result.errors.size(), 5u);
    EXPECT_EQ(result.errors[0], "Component ID is required and cannot be empty");
    EXPECT_EQ(result.errors[1],
              "Component bounds must have positive width and height, and non-negative coordinates");
    EXPECT_EQ(result.errors[2], "Component priority should be between 0 and 1000");
    EXPECT_EQ(result.errors[3], "Accessibility label is required");
    EXPECT_EQ(result.errors[4], "Tab index should be -1 or greater");
}

TEST_F(ComponentRegistryTest, ValidationCanBeRelaxed) {
    config.validateRegions = false;
    ClickableRegion unlabeled = MakeRegion("raw", {0, 0, 0, 0}, 5000);
    unlabeled.accessibility.label.clear();

    EXPECT_TRUE(Registry().Register(unlabeled).success);
    EXPECT_EQ(Registry().Register(MakeRegion("", {0, 0, 1, 1})).error, RegistrationError::Validation);
}

TEST_F(ComponentRegistryTest, DuplicateIdRejected) {
    ASSERT_TRUE(Registry().Register(MakeRegion("dup", {0, 0, 2, 2})).success);

    RegistrationResult result = Registry().Register(MakeRegion("dup", {10, 10, 2, 2}));

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error, RegistrationError::DuplicateId);
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(result.errors[0], "Component with ID 'dup' is already registered");
    EXPECT_EQ(Registry().Get("dup")->bounds.x, 0);
}

TEST_F(ComponentRegistryTest, OverlapAtEqualPriorityWarns) {
    Registry().Register(MakeRegion("a", {0, 0, 10, 2}, 5));

    RegistrationResult same = Registry().Register(MakeRegion("b", {5, 1, 10, 2}, 5));
    RegistrationResult higher = Registry().Register(MakeRegion("c", {5, 1, 10, 2}, 6));

    EXPECT_TRUE(same.success);
    ASSERT_EQ(same.warnings.size(), 1u);
    EXPECT_EQ(same.warnings[0], "Component 'b' overlaps 'a' at equal priority 5");
    EXPECT_TRUE(higher.warnings.empty());
}

// ============================================================================
// Hit-testing
// ============================================================================

TEST_F(ComponentRegistryTest, FindAtRespectsHalfOpenBounds) {
    Registry().Register(MakeRegion("box", {2, 3, 4, 2}));

    EXPECT_NE(Registry().FindAt(2, 3), nullptr);
    EXPECT_NE(Registry().FindAt(5, 4), nullptr);
    EXPECT_EQ(Registry().FindAt(6, 4), nullptr);
    EXPECT_EQ(Registry().FindAt(5, 5), nullptr);
    EXPECT_EQ(Registry().FindAt(1, 3), nullptr);
}

TEST_F(ComponentRegistryTest, HighestPriorityWins) {
    Registry().Register(MakeRegion("low", {0, 0, 20, 10}, 1));
    Registry().Register(MakeRegion("high", {5, 5, 5, 5}, 100));

    EXPECT_EQ(Registry().FindAt(6, 6)->id, "high");
    EXPECT_EQ(Registry().FindAt(1, 1)->id, "low");
}

TEST_F(ComponentRegistryTest, EqualPriorityGoesToFirstRegistered) {
    Registry().Register(MakeRegion("first", {0, 0, 10, 10}, 3));
    Registry().Register(MakeRegion("second", {0, 0, 10, 10}, 3));

    EXPECT_EQ(Registry().FindAt(4, 4)->id, "first");
    EXPECT_EQ(Registry().FindAtLinear(4, 4)->id, "first");
}

TEST_F(ComponentRegistryTest, DisabledAndHiddenRegionsAreSkipped) {
    Registry().Register(MakeRegion("under", {0, 0, 10, 10}, 1));
    Registry().Register(MakeRegion("over", {0, 0, 10, 10}, 9));

    Registry().SetEnabled("over", false);
    EXPECT_EQ(Registry().FindAt(1, 1)->id, "under");

    Registry().SetEnabled("over", true);
    Registry().SetVisible("over", false);
    EXPECT_EQ(Registry().FindAt(1, 1)->id, "under");

    Registry().SetVisible("under", false);
    EXPECT_EQ(Registry().FindAt(1, 1), nullptr);
}

TEST_F(ComponentRegistryTest, RegionsOutsideTerminalStillFound) {
    Registry().Register(MakeRegion("offscreen", {100, 30, 5, 5}));

    ASSERT_NE(Registry().FindAt(102, 32), nullptr);
    EXPECT_EQ(Registry().FindAt(102, 32)->id, "offscreen");
}

TEST_F(ComponentRegistryTest, IndexedLookupMatchesLinearScan) {
    config.terminalWidth = 120;
    config.terminalHeight = 40;
    std::mt19937 rng(1234);
    std::uniform_int_distribution<int> pos(0, 125);
    std::uniform_int_distribution<int> row(0, 42);
    std::uniform_int_distribution<int> size(1, 20);
    std::uniform_int_distribution<int> prio(0, 5);

    for (int i = 0; i < 80; ++i) {
        Registry().Register(MakeRegion("r" + std::to_string(i),
                                       {pos(rng), row(rng), size(rng), size(rng) / 2 + 1}, prio(rng)));
    }
    Registry().SetEnabled("r3", false);
    Registry().SetVisible("r7", false);
    ASSERT_GT(Registry().GetStats().indexDepth, 0);

    for (int y = -2; y < 45; ++y) {
        for (int x = -2; x < 130; ++x) {
            ASSERT_EQ(Registry().FindAt(x, y), Registry().FindAtLinear(x, y))
                << "at " << x << "," << y;
        }
    }
}

TEST_F(ComponentRegistryTest, LookupWithoutSpatialIndex) {
    config.enableSpatialIndex = false;
    Registry().Register(MakeRegion("a", {0, 0, 4, 4}));

    EXPECT_EQ(Registry().FindAt(1, 1)->id, "a");
    EXPECT_EQ(Registry().GetStats().indexNodes, 0u);
}

TEST_F(ComponentRegistryTest, TerminalResizeKeepsLookupsCorrect) {
    Registry().Register(MakeRegion("wide", {90, 0, 10, 2}));

    Registry().SetTerminalBounds(200, 50);

    EXPECT_EQ(Registry().GetTerminalBounds().width, 200);
    EXPECT_EQ(Registry().FindAt(95, 1)->id, "wide");
}

// ============================================================================
// Mutation
// ============================================================================

TEST_F(ComponentRegistryTest, UnregisterRemovesFromLookup) {
    Registry().Register(MakeRegion("gone", {0, 0, 3, 3}));

    EXPECT_TRUE(Registry().Unregister("gone"));
    EXPECT_FALSE(Registry().Unregister("gone"));
    EXPECT_EQ(Registry().FindAt(1, 1), nullptr);
}

TEST_F(ComponentRegistryTest, UnregisterByIdOfStoredRegion) {
    Registry().Register(MakeRegion("first", {0, 0, 3, 3}));
    Registry().Register(MakeRegion("second", {5, 0, 3, 3}));

    for (const ClickableRegion* region : Registry().GetAll()) {
        EXPECT_TRUE(Registry().Unregister(region->id));
    }

    EXPECT_TRUE(Registry().GetAll().empty());
    const auto& changes = Registry().GetChangeEvents();
    ASSERT_EQ(changes.size(), 4u);
    EXPECT_EQ(changes[2].type, RegionChangeType::Removed);
    EXPECT_EQ(changes[2].regionId, "first");
    EXPECT_EQ(changes[3].regionId, "second");
}

TEST_F(ComponentRegistryTest, MoveRelocatesRegion) {
    Registry().Register(MakeRegion("m", {0, 0, 3, 3}));

    RegistrationResult result = Registry().Move("m", {40, 10, 3, 3});

    EXPECT_TRUE(result.success);
    EXPECT_EQ(Registry().FindAt(1, 1), nullptr);
    EXPECT_EQ(Registry().FindAt(41, 11)->id, "m");

    const RegionChangeEvent& last = Registry().GetChangeEvents().back();
    EXPECT_EQ(last.type, RegionChangeType::Moved);
    ASSERT_TRUE(last.previousBounds.has_value());
    EXPECT_EQ(*last.previousBounds, (RegionBounds{0, 0, 3, 3}));
}

TEST_F(ComponentRegistryTest, MoveToInvalidBoundsRejected) {
    Registry().Register(MakeRegion("m", {0, 0, 3, 3}));

    RegistrationResult result = Registry().Move("m", {0, 0, 0, 3});

    EXPECT_EQ(result.error, RegistrationError::Validation);
    EXPECT_EQ(Registry().Get("m")->bounds.width, 3);
}

TEST_F(ComponentRegistryTest, UpdateUnknownRegionFails) {
    RegionUpdate update;
    update.priority = 4;

    RegistrationResult result = Registry().Update("nope", update);

    EXPECT_EQ(result.error, RegistrationError::NotFound);
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(result.errors[0], "Component with ID 'nope' is not registered");
}

TEST_F(ComponentRegistryTest, UpdateMergesFields) {
    Registry().Register(MakeRegion("u", {0, 0, 3, 3}, 1));

    RegionUpdate update;
    update.priority = 50;
    update.bounds = RegionBounds{10, 10, 2, 2};
    RegistrationResult result = Registry().Update("u", update);

    ASSERT_TRUE(result.success);
    const ClickableRegion* region = Registry().Get("u");
    EXPECT_EQ(region->priority, 50);
    EXPECT_EQ(region->bounds, (RegionBounds{10, 10, 2, 2}));
    EXPECT_EQ(region->accessibility.label, "u");
    EXPECT_EQ(Registry().FindAt(11, 11)->id, "u");
    EXPECT_EQ(Registry().GetChangeEvents().back().type, RegionChangeType::Updated);
}

TEST_F(ComponentRegistryTest, UpdateThatInvalidatesIsRejected) {
    Registry().Register(MakeRegion("u", {0, 0, 3, 3}, 1));

    RegionUpdate update;
    update.priority = -5;

    EXPECT_EQ(Registry().Update("u", update).error, RegistrationError::Validation);
    EXPECT_EQ(Registry().Get("u")->priority, 1);
}

TEST_F(ComponentRegistryTest, ClearRemovesEverything) {
    Registry().Register(MakeRegion("a", {0, 0, 1, 1}));
    Registry().Register(MakeRegion("b", {1, 0, 1, 1}));

    Registry().Clear();

    EXPECT_EQ(Registry().Size(), 0u);
    EXPECT_EQ(Registry().FindAt(0, 0), nullptr);
    EXPECT_EQ(Registry().GetChangeEvents().back().type, RegionChangeType::Removed);
}

// ============================================================================
// Query and Statistics
// ============================================================================

TEST_F(ComponentRegistryTest, QuerySortsByPriorityThenRegistration) {
    Registry().Register(MakeRegion("a", {0, 0, 2, 2}, 1));
    Registry().Register(MakeRegion("b", {3, 0, 2, 2}, 7));
    Registry().Register(MakeRegion("c", {6, 0, 2, 2}, 1));
    ClickableRegion link = MakeRegion("d", {9, 0, 2, 2}, 7);
    link.type = RegionType::Link;
    Registry().Register(link);

    auto all = Registry().Query({});
    ASSERT_EQ(all.size(), 4u);
    EXPECT_EQ(all[0]->id, "b");
    EXPECT_EQ(all[1]->id, "d");
    EXPECT_EQ(all[2]->id, "a");
    EXPECT_EQ(all[3]->id, "c");

    RegionQuery links;
    links.types = {RegionType::Link};
    ASSERT_EQ(Registry().Query(links).size(), 1u);

    RegionQuery lowPriority;
    lowPriority.maxPriority = 5;
    EXPECT_EQ(Registry().Query(lowPriority).size(), 2u);

    RegionQuery atPoint;
    atPoint.containsPoint = Terminal::MouseCoordinates{4, 1};
    auto hits = Registry().Query(atPoint);
    ASSERT_EQ(hits.size(), 1u);
    EXPECT_EQ(hits[0]->id, "b");
}

TEST_F(ComponentRegistryTest, IdsInRegistrationOrder) {
    for (const char* id : {"zeta", "alpha", "mid"}) {
        Registry().Register(MakeRegion(id, {0, 0, 1, 1}, 10));
    }

    std::vector<std::string> expected{"zeta", "alpha", "mid"};
    EXPECT_EQ(Registry().GetRegionIds(), expected);
}

TEST_F(ComponentRegistryTest, StatsCountRegions) {
    Registry().Register(MakeRegion("a", {0, 0, 1, 1}));
    ClickableRegion link = MakeRegion("b", {1, 0, 1, 1});
    link.type = RegionType::Link;
    Registry().Register(link);
    Registry().SetEnabled("a", false);
    Registry().FindAt(0, 0);

    RegistryStats stats = Registry().GetStats();
    EXPECT_EQ(stats.totalRegions, 2u);
    EXPECT_EQ(stats.enabledRegions, 1u);
    EXPECT_EQ(stats.visibleRegions, 2u);
    EXPECT_EQ(stats.regionsByType[RegionType::Button], 1u);
    EXPECT_EQ(stats.regionsByType[RegionType::Link], 1u);
    EXPECT_EQ(stats.changeEvents, 3u);
    EXPECT_GE(stats.averageLookupTimeMs, 0.0);
}

// ============================================================================
// Change Events
// ============================================================================

TEST_F(ComponentRegistryTest, ChangeHistoryIsBounded) {
    config.maxChangeEvents = 5;

    for (int i = 0; i < 12; ++i) {
        Registry().Register(MakeRegion("r" + std::to_string(i), {i, 0, 1, 1}));
    }

    const auto& events = Registry().GetChangeEvents();
    ASSERT_EQ(events.size(), 5u);
    EXPECT_EQ(events.front().regionId, "r7");
    EXPECT_EQ(events.back().regionId, "r11");
}

TEST_F(ComponentRegistryTest, ListenersReceiveChanges) {
    std::vector<RegionChangeType> seen;
    int id = Registry().AddChangeListener([&](const RegionChangeEvent& e) { seen.push_back(e.type); });

    Registry().Register(MakeRegion("a", {0, 0, 1, 1}));
    Registry().SetEnabled("a", false);
    Registry().SetEnabled("a", false);   // No change, no event
    Registry().SetEnabled("a", true);
    Registry().RemoveChangeListener(id);
    Registry().Unregister("a");

    std::vector<RegionChangeType> expected{
        RegionChangeType::Added, RegionChangeType::Disabled, RegionChangeType::Enabled};
    EXPECT_EQ(seen, expected);
}

TEST_F(ComponentRegistryTest, ThrowingListenerIsLoggedAndSkipped) {
    std::ostringstream captured;
    auto previous = spdlog::default_logger();
    auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(captured);
    spdlog::set_default_logger(std::make_shared<spdlog::logger>("capture", sink));

    int calls = 0;
    Registry().AddChangeListener([](const RegionChangeEvent&) { throw std::runtime_error("boom"); });
    Registry().AddChangeListener([&](const RegionChangeEvent&) { ++calls; });

    RegistrationResult result = Registry().Register(MakeRegion("a", {0, 0, 1, 1}));

    spdlog::set_default_logger(previous);
    EXPECT_TRUE(result.success);
    EXPECT_EQ(calls, 1);
    EXPECT_NE(captured.str().find("boom"), std::string::npos);
}

TEST_F(ComponentRegistryTest, ChangeEventsCarryClockTime) {
    Registry().Register(MakeRegion("a", {0, 0, 1, 1}));
    clock.Advance(std::chrono::milliseconds(40));
    Registry().SetVisible("a", false);

    const auto& events = Registry().GetChangeEvents();
    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[1].type, RegionChangeType::Updated);
    EXPECT_EQ(events[1].timestamp - events[0].timestamp, std::chrono::milliseconds(40));
}

// ============================================================================
// QuadTreeIndex
// ============================================================================

TEST(QuadTreeIndexTest, SmallSetStaysAtRoot) {
    QuadTreeIndex index(4, 4);
    index.Rebuild({0, 0, 80, 24}, {{"a", {0, 0, 2, 2}}, {"b", {50, 10, 2, 2}}});

    EXPECT_EQ(index.Depth(), 0);
    EXPECT_EQ(index.NodeCount(), 1u);
    EXPECT_EQ(index.Candidates(1, 1).size(), 2u);
}

TEST(QuadTreeIndexTest, SubdividesAndNarrowsCandidates) {
    std::vector<IndexEntry> entries;
    for (int i = 0; i < 8; ++i) {
        entries.push_back({"tl" + std::to_string(i), {i, 0, 1, 1}});
        entries.push_back({"br" + std::to_string(i), {60 + i, 20, 1, 1}});
    }
    QuadTreeIndex index(4, 4);
    index.Rebuild({0, 0, 80, 24}, entries);

    EXPECT_GT(index.Depth(), 0);
    for (const std::string& id : index.Candidates(2, 0)) {
        EXPECT_EQ(id.rfind("tl", 0), 0u) << id;
    }
    EXPECT_TRUE(index.Candidates(30, 15).empty());
}

TEST(QuadTreeIndexTest, DepthIsCapped) {
    std::vector<IndexEntry> entries;
    for (int i = 0; i < 50; ++i) {
        entries.push_back({"r" + std::to_string(i), {0, 0, 1, 1}});
    }
    QuadTreeIndex index(3, 1);
    index.Rebuild({0, 0, 80, 24}, entries);

    EXPECT_EQ(index.Depth(), 3);
    EXPECT_EQ(index.Candidates(0, 0).size(), 50u);
}

TEST(QuadTreeIndexTest, OddSizedRootLeavesNoGaps) {
    std::vector<IndexEntry> entries;
    for (int i = 0; i < 6; ++i) {
        entries.push_back({"edge" + std::to_string(i), {78, 22, 1, 1}});
    }
    QuadTreeIndex index(4, 2);
    index.Rebuild({0, 0, 79, 23}, entries);

    EXPECT_EQ(index.Candidates(78, 22).size(), 6u);
}

TEST(QuadTreeIndexTest, PointOutsideRootReturnsEverything) {
    std::vector<IndexEntry> entries;
    for (int i = 0; i < 10; ++i) {
        entries.push_back({"r" + std::to_string(i), {i * 5, 0, 2, 2}});
    }
    QuadTreeIndex index(4, 2);
    index.Rebuild({0, 0, 80, 24}, entries);

    EXPECT_EQ(index.Candidates(-1, 5).size(), 10u);
    EXPECT_EQ(index.Candidates(500, 500).size(), 10u);
}

TEST(QuadTreeIndexTest, ClearEmptiesIndex) {
    QuadTreeIndex index(4, 4);
    index.Rebuild({0, 0, 10, 10}, {{"a", {0, 0, 1, 1}}});
    index.Clear();

    EXPECT_TRUE(index.Candidates(0, 0).empty());
    EXPECT_EQ(index.NodeCount(), 0u);
}

} // namespace Tests
} // namespace TerminalMouse::UI
