#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "ordered_set.hpp"

TEST(OrderedSet, KeepsFirstOccurrenceOrder) {
    std::vector<std::string> lines{"GET /a 200", "GET /b 200", "GET /a 200", "GET /c 404", "GET /b 200"};
    OrderedSet<std::string> unique(lines.begin(), lines.end());

    std::vector<std::string> expected{"GET /a 200", "GET /b 200", "GET /c 404"};
    EXPECT_EQ(unique.to_vector(), expected);
    EXPECT_EQ(unique.size(), 3u);
}

TEST(OrderedSet, InsertReportsDuplicates) {
    OrderedSet<int> set;
    EXPECT_TRUE(set.empty());
    EXPECT_TRUE(set.insert(3));
    EXPECT_TRUE(set.insert(1));
    EXPECT_FALSE(set.insert(3));
    EXPECT_TRUE(set.contains(1));
    EXPECT_FALSE(set.contains(2));

    std::vector<int> seen(set.begin(), set.end());
    EXPECT_EQ(seen, (std::vector<int>{3, 1}));
}

TEST(OrderedSet, EmptyRange) {
    std::vector<std::string> none;
    OrderedSet<std::string> set(none.begin(), none.end());
    EXPECT_TRUE(set.empty());
    EXPECT_TRUE(set.to_vector().empty());
}
