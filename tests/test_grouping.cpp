#include <gtest/gtest.h>
#include "common/errors.hpp"
#include "space/execution_grouper.hpp"
#include "space/space_expander.hpp"

#include <algorithm>

using namespace adabench;
using nlohmann::json;

namespace {

std::vector<BenchmarkDescription> sampleSpace() {
    BenchmarkTemplate a;
    a.set("name", json::array({"fruit_compile_time", "fruit_run_time"}));
    a.set("compiler", json::array({"g++", "clang++"}));
    a.set("num_classes", json::array({100, 1000}));
    a.set("additional_cmake_args", json::array({json::array(), json::array({"-DFRUIT_USES_BOOST=False"})}));

    BenchmarkTemplate b;
    b.set("name", "new_delete_run_time");
    b.set("compiler", json::array({"clang++", "g++"}));
    b.set("additional_cmake_args", json::array({json::array()}));

    return SpaceExpander::expandAll({a, b});
}

} // namespace

TEST(GroupingTest, GroupsPartitionTheInput) {
    auto descriptions = sampleSpace();
    auto groups = ExecutionGrouper::group(descriptions);

    std::vector<BenchmarkDescription> seen;
    for (const auto& g : groups) {
        for (const auto& d : g.descriptions) seen.push_back(d);
    }
    ASSERT_EQ(seen.size(), descriptions.size());

    auto sorted_seen = seen;
    auto sorted_input = descriptions;
    std::sort(sorted_seen.begin(), sorted_seen.end());
    std::sort(sorted_input.begin(), sorted_input.end());
    EXPECT_EQ(sorted_seen, sorted_input);
}

TEST(GroupingTest, SameGroupIffSameKey) {
    auto groups = ExecutionGrouper::group(sampleSpace());

    for (size_t i = 0; i < groups.size(); i++) {
        for (const auto& d : groups[i].descriptions) {
            EXPECT_EQ(ExecutionGrouper::keyOf(d), groups[i].key);
        }
        for (size_t j = i + 1; j < groups.size(); j++) {
            EXPECT_NE(groups[i].key, groups[j].key);
        }
    }
    // 2 compilers × 2 arg sets
    EXPECT_EQ(groups.size(), 4u);
}

TEST(GroupingTest, FirstSeenOrderIsPreserved) {
    auto descriptions = sampleSpace();
    auto groups = ExecutionGrouper::group(descriptions);

    ASSERT_FALSE(groups.empty());
    EXPECT_EQ(groups[0].key, ExecutionGrouper::keyOf(descriptions[0]));

    // Within a group, descriptions keep their relative input order.
    for (const auto& g : groups) {
        size_t last = 0;
        for (const auto& d : g.descriptions) {
            auto pos = static_cast<size_t>(std::find(descriptions.begin(), descriptions.end(), d) - descriptions.begin());
            EXPECT_GE(pos, last);
            last = pos;
        }
    }
}

TEST(GroupingTest, MissingCmakeArgsMeansEmptyList) {
    BenchmarkDescription with_empty;
    with_empty.set("compiler", "g++");
    with_empty.set("additional_cmake_args", json::array());

    BenchmarkDescription without;
    without.set("compiler", "g++");

    EXPECT_EQ(ExecutionGrouper::keyOf(with_empty), ExecutionGrouper::keyOf(without));
    EXPECT_EQ(ExecutionGrouper::group({with_empty, without}).size(), 1u);
}

TEST(GroupingTest, MissingCompilerIsAConfigurationError) {
    BenchmarkDescription desc;
    desc.set("name", "fruit_compile_time");
    EXPECT_THROW(ExecutionGrouper::keyOf(desc), ConfigurationError);
}

TEST(GroupingTest, GenericGroupBy) {
    std::vector<int> values = {5, 2, 8, 3, 6, 1};
    auto groups = groupBy(values, [](int v) { return v % 3; });

    ASSERT_EQ(groups.size(), 3u);
    EXPECT_EQ(groups[0].first, 2);
    EXPECT_EQ(groups[0].second, (std::vector<int>{5, 2, 8}));
    EXPECT_EQ(groups[1].first, 0);
    EXPECT_EQ(groups[1].second, (std::vector<int>{3, 6}));
    EXPECT_EQ(groups[2].first, 1);
    EXPECT_EQ(groups[2].second, (std::vector<int>{1}));
}
