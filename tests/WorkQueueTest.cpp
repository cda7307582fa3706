#include "meterlink/WorkQueue.hpp"
#include "TestUtil.hpp"
#include <gtest/gtest.h>

using namespace meterlink;
using test::makeItem;

TEST(WorkQueue, AddAssignsIdsAndRejectsDuplicatePaths) {
    WorkQueue q;
    std::uint64_t a = 0, b = 0, c = 0;
    std::string err;
    ASSERT_TRUE(q.add(makeItem("/d/a.xlsx", FileCategory::Tabular), a, err));
    ASSERT_TRUE(q.add(makeItem("/d/b.png", FileCategory::Image), b, err));
    EXPECT_NE(a, b);
    EXPECT_FALSE(q.add(makeItem("/d/a.xlsx", FileCategory::Tabular), c, err));
    EXPECT_NE(err.find("a.xlsx"), std::string::npos);
    EXPECT_EQ(q.size(), 2u);

    const auto counts = q.counts();
    EXPECT_EQ(counts.tabular, 1u);
    EXPECT_EQ(counts.image, 1u);
    EXPECT_EQ(counts.total(), 2u);
}

TEST(WorkQueue, SelectionControlsWhatIsEligible) {
    WorkQueue q;
    std::uint64_t a = 0, b = 0;
    std::string err;
    ASSERT_TRUE(q.add(makeItem("/d/a.xlsx", FileCategory::Tabular), a, err));
    ASSERT_TRUE(q.add(makeItem("/d/b.xls", FileCategory::Tabular), b, err));
    EXPECT_EQ(q.selected().size(), 2u);

    EXPECT_TRUE(q.setSelected(a, false));
    auto sel = q.selected();
    ASSERT_EQ(sel.size(), 1u);
    EXPECT_EQ(sel[0].id, b);

    q.deselectAll();
    EXPECT_TRUE(q.selected().empty());
    q.selectAll();
    EXPECT_EQ(q.selected().size(), 2u);
    EXPECT_FALSE(q.setSelected(999, true));
}

TEST(WorkQueue, RemoveAndClear) {
    WorkQueue q;
    std::uint64_t a = 0, b = 0;
    std::string err;
    ASSERT_TRUE(q.add(makeItem("/d/a.xlsx", FileCategory::Tabular), a, err));
    ASSERT_TRUE(q.add(makeItem("/d/b.jpg", FileCategory::Image), b, err));

    EXPECT_TRUE(q.remove(a, err));
    EXPECT_FALSE(q.remove(a, err));
    EXPECT_FALSE(q.find(a).has_value());
    EXPECT_TRUE(q.find(b).has_value());

    EXPECT_EQ(q.clear(), 1u);
    EXPECT_EQ(q.size(), 0u);

    // The same path may be queued again once the old item is gone
    std::uint64_t c = 0;
    EXPECT_TRUE(q.add(makeItem("/d/a.xlsx", FileCategory::Tabular), c, err));
}

TEST(WorkQueue, RetryOnlyAppliesToFailedItems) {
    WorkQueue q;
    std::uint64_t a = 0;
    std::string err;
    ASSERT_TRUE(q.add(makeItem("/d/a.xlsx", FileCategory::Tabular), a, err));
    EXPECT_FALSE(q.retry(a));
    EXPECT_EQ(q.status(a), TransferItem::Status::Pending);
    EXPECT_FALSE(q.status(12345).has_value());
}
