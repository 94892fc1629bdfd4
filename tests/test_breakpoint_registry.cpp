#include <gtest/gtest.h>
#include "flowdebug/debug/breakpoint_registry.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>

namespace flowdebug::test {

class BreakpointRegistryTest : public ::testing::Test {
protected:
    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(temp_dir(), ec);
    }

    static std::filesystem::path temp_dir() {
        return std::filesystem::temp_directory_path() / "flowdebug_breakpoint_test";
    }

    BreakpointRegistry registry;
};

TEST_F(BreakpointRegistryTest, AddGeneratesUniqueIds) {
    auto first = registry.add(Breakpoint::line(1));
    auto second = registry.add(Breakpoint::line(2));

    EXPECT_FALSE(first.empty());
    EXPECT_NE(first, second);
    EXPECT_EQ(registry.size(), 2u);
    EXPECT_EQ(registry.get(first)->step_index, 1);
}

TEST_F(BreakpointRegistryTest, AddWithExistingIdReplaces) {
    Breakpoint bp = Breakpoint::line(1);
    bp.id = "entry";
    registry.add(bp);

    bp.step_index = 4;
    registry.add(bp);

    EXPECT_EQ(registry.size(), 1u);
    EXPECT_EQ(registry.get("entry")->step_index, 4);
}

TEST_F(BreakpointRegistryTest, ListPreservesInsertionOrder) {
    auto a = registry.add(Breakpoint::line(5));
    auto b = registry.add(Breakpoint::error());
    auto c = registry.add(Breakpoint::line(1));

    auto all = registry.list();
    ASSERT_EQ(all.size(), 3u);
    EXPECT_EQ(all[0].id, a);
    EXPECT_EQ(all[1].id, b);
    EXPECT_EQ(all[2].id, c);
}

TEST_F(BreakpointRegistryTest, UnknownIdsAreReportedNotThrown) {
    EXPECT_FALSE(registry.remove("nope"));
    EXPECT_FALSE(registry.set_enabled("nope", false));
    EXPECT_FALSE(registry.get("nope").has_value());
    EXPECT_FALSE(registry.record_hit("nope"));
}

TEST_F(BreakpointRegistryTest, EnabledOfTypeFiltersDisabled) {
    auto a = registry.add(Breakpoint::line(1));
    registry.add(Breakpoint::line(2));
    registry.add(Breakpoint::error());
    ASSERT_TRUE(registry.set_enabled(a, false));

    auto lines = registry.enabled_of_type(BreakpointType::LINE);
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0].step_index, 2);
    EXPECT_EQ(registry.enabled_of_type(BreakpointType::ERROR).size(), 1u);
}

TEST_F(BreakpointRegistryTest, RecordHitOnlyCountsEnabled) {
    auto id = registry.add(Breakpoint::line(0));
    EXPECT_TRUE(registry.record_hit(id));
    EXPECT_TRUE(registry.record_hit(id));
    EXPECT_EQ(registry.get(id)->hit_count, 2u);

    registry.set_enabled(id, false);
    EXPECT_FALSE(registry.record_hit(id));
    EXPECT_EQ(registry.get(id)->hit_count, 2u);
}

TEST_F(BreakpointRegistryTest, ToggleTwiceLeavesNoBreakpoint) {
    auto [created, id] = registry.toggle(3);
    EXPECT_TRUE(created);
    ASSERT_TRUE(registry.get(id).has_value());
    EXPECT_EQ(registry.get(id)->type, BreakpointType::LINE);

    auto [removed, message] = registry.toggle(3);
    EXPECT_TRUE(removed);
    EXPECT_EQ(message, "Removed breakpoint #" + id);
    EXPECT_TRUE(registry.empty());
}

TEST_F(BreakpointRegistryTest, ToggleIgnoresOtherTypes) {
    registry.add(Breakpoint::conditional(3, "x > 1"));
    auto [ok, id] = registry.toggle(3);
    EXPECT_TRUE(ok);
    EXPECT_EQ(registry.size(), 2u);
    EXPECT_EQ(registry.get(id)->type, BreakpointType::LINE);
}

TEST_F(BreakpointRegistryTest, DictRoundTripPreservesFields) {
    Breakpoint bp = Breakpoint::variable("status", ComparisonOperator::NOT_EQUAL, Value("done"));
    bp.id = "watch-status";
    bp.enabled = false;
    bp.hit_count = 3;

    auto dict = bp.to_dict();
    EXPECT_EQ(dict["type"].get<std::string>(), "variable");
    EXPECT_EQ(dict["variable_value"].get<std::string>(), "done");
    EXPECT_EQ(dict["comparison_operator"].get<std::string>(), "!=");

    auto restored = Breakpoint::from_dict(dict);
    ASSERT_TRUE(restored.has_value());
    EXPECT_EQ(restored->id, "watch-status");
    EXPECT_EQ(restored->type, BreakpointType::VARIABLE);
    EXPECT_EQ(restored->variable_name, "status");
    EXPECT_EQ(restored->variable_value, Value("done"));
    EXPECT_EQ(restored->comparison_operator, ComparisonOperator::NOT_EQUAL);
    EXPECT_FALSE(restored->enabled);
    EXPECT_EQ(restored->hit_count, 3u);
    EXPECT_EQ(restored->step_index, kAnyStep);
}

TEST_F(BreakpointRegistryTest, StringifiedValuesKeepTheirType) {
    auto numeric = Breakpoint::variable("count", ComparisonOperator::GREATER, Value(5));
    EXPECT_EQ(numeric.to_dict()["variable_value"].get<std::string>(), "5");
    EXPECT_TRUE(Breakpoint::from_dict(numeric.to_dict())->variable_value.is_integer());

    // A string that looks like a number must stay a string
    auto text = Breakpoint::variable("code", ComparisonOperator::EQUAL, Value("5"));
    EXPECT_EQ(text.to_dict()["variable_value"].get<std::string>(), "'5'");
    auto restored = Breakpoint::from_dict(text.to_dict());
    ASSERT_TRUE(restored.has_value());
    EXPECT_TRUE(restored->variable_value.is_string());
    EXPECT_EQ(restored->variable_value, Value("5"));
}

TEST_F(BreakpointRegistryTest, FromDictAppliesDefaults) {
    auto bp = Breakpoint::from_dict(nlohmann::json{{"step_index", 2}});
    ASSERT_TRUE(bp.has_value());
    EXPECT_EQ(bp->type, BreakpointType::LINE);
    EXPECT_TRUE(bp->enabled);
    EXPECT_EQ(bp->hit_count, 0u);
    EXPECT_EQ(bp->comparison_operator, ComparisonOperator::EQUAL);
}

TEST_F(BreakpointRegistryTest, FromDictRejectsMalformedEntries) {
    EXPECT_FALSE(Breakpoint::from_dict(nlohmann::json::array()).has_value());
    EXPECT_FALSE(Breakpoint::from_dict(nlohmann::json{{"type", "bogus"}}).has_value());
    EXPECT_FALSE(Breakpoint::from_dict(nlohmann::json{{"type", "condition"}}).has_value());
    EXPECT_FALSE(Breakpoint::from_dict(nlohmann::json{{"type", "variable"}}).has_value());
    EXPECT_FALSE(Breakpoint::from_dict(nlohmann::json{{"step_index", "two"}}).has_value());
}

TEST_F(BreakpointRegistryTest, SaveAndLoadFile) {
    registry.add(Breakpoint::line(1));
    registry.add(Breakpoint::conditional(2, "x > 3"));
    registry.add(Breakpoint::error());

    auto path = (temp_dir() / "nested" / "breakpoints.json").string();
    auto saved = registry.save(path);
    ASSERT_TRUE(saved.has_value()) << saved.error().to_string();
    EXPECT_EQ(saved.value(), "Breakpoints saved to " + path);

    BreakpointRegistry restored;
    restored.add(Breakpoint::line(9));
    auto loaded = restored.load(path);
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded.value(), 3u);
    EXPECT_EQ(restored.size(), 3u);
    EXPECT_EQ(restored.list()[1].condition, "x > 3");
}

TEST_F(BreakpointRegistryTest, LoadCanMerge) {
    nlohmann::json data = nlohmann::json::array({Breakpoint::line(4).to_dict()});
    registry.add(Breakpoint::line(1));

    auto loaded = registry.load_json(data, false);
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(registry.size(), 2u);
}

TEST_F(BreakpointRegistryTest, InvalidFileLeavesRegistryUntouched) {
    registry.add(Breakpoint::line(1));

    std::filesystem::create_directories(temp_dir());
    auto path = temp_dir() / "broken.json";
    std::ofstream(path) << R"([{"step_index": 1}, {"type": "condition"}])";

    auto loaded = registry.load(path.string());
    ASSERT_FALSE(loaded.has_value());
    EXPECT_EQ(loaded.error().code(), ErrorCode::BREAKPOINT_INVALID);
    EXPECT_EQ(registry.size(), 1u);

    auto missing = registry.load((temp_dir() / "missing.json").string());
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error().code(), ErrorCode::FILE_ERROR);
}

TEST_F(BreakpointRegistryTest, SaveToUnwritablePathFails) {
    auto result = registry.save("/proc/flowdebug/breakpoints.json");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::FILE_ERROR);
}

}  // namespace flowdebug::test
