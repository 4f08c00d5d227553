#include <gtest/gtest.h>

#include "leaks.h"
#include "test_utils.h"

namespace memscope::api {
namespace {

using test_utils::makeRecord;

TEST(LeakAnalysisTest, GroupsActiveAllocationsBySize)
{
    MemorySnapshot snapshot;
    snapshot.current_usage = 400;
    snapshot.active_allocations[0x1000] = makeRecord(100);
    snapshot.active_allocations[0x2000] = makeRecord(100);
    snapshot.active_allocations[0x3000] = makeRecord(200);

    LeakSummary summary = analyzeLeaks(snapshot);

    EXPECT_EQ(summary.total_leaked_bytes, 400u);
    EXPECT_EQ(summary.leak_count, 3u);
    ASSERT_TRUE(summary.largest_leak);
    EXPECT_EQ(*summary.largest_leak, 200u);
    std::vector<std::pair<size_t, size_t>> expected{{200, 1}, {100, 2}};
    EXPECT_EQ(summary.leaks_by_size, expected);
}

TEST(LeakAnalysisTest, EmptyLedgerStillReportsResidualUsage)
{
    MemorySnapshot snapshot;
    snapshot.current_usage = 8192;

    LeakSummary summary = analyzeLeaks(snapshot);

    EXPECT_EQ(summary.total_leaked_bytes, 8192u);
    EXPECT_EQ(summary.leak_count, 0u);
    EXPECT_FALSE(summary.largest_leak);
    EXPECT_TRUE(summary.leaks_by_size.empty());
}

TEST(LeakAnalysisTest, CountsAndSizesAddUp)
{
    MemorySnapshot snapshot;
    size_t total = 0;
    for (size_t i = 1; i <= 50; ++i) {
        size_t size = (i % 7 + 1) * 16;
        snapshot.active_allocations[i * 0x100] = makeRecord(size);
        total += size;
    }
    snapshot.current_usage = total;

    LeakSummary summary = analyzeLeaks(snapshot);

    size_t count = 0;
    size_t bytes = 0;
    size_t previous_size = SIZE_MAX;
    for (const auto& [size, n] : summary.leaks_by_size) {
        EXPECT_LT(size, previous_size);
        previous_size = size;
        count += n;
        bytes += size * n;
    }
    EXPECT_EQ(count, summary.leak_count);
    EXPECT_EQ(bytes, total);
    EXPECT_EQ(*summary.largest_leak, summary.leaks_by_size.front().first);
}

TEST(LeakAnalysisTest, DoesNotModifyTheSnapshot)
{
    MemorySnapshot snapshot;
    snapshot.current_usage = 64;
    snapshot.active_allocations[0x1000] = makeRecord(64);
    const MemorySnapshot copy = snapshot;

    LeakSummary first = analyzeLeaks(snapshot);
    LeakSummary second = analyzeLeaks(snapshot);

    EXPECT_EQ(snapshot, copy);
    EXPECT_EQ(first, second);
}

}  // namespace
}  // namespace memscope::api
