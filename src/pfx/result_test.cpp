#include <gtest/gtest.h>

#include <string>

#include <pfx/result.hpp>

TEST(ResultEntry, KeyIsMutable) {
    using namespace pfx;
    result_entry<int> e(5);
    ASSERT_FALSE(e.has_key());
    e.set_key("five");
    ASSERT_TRUE(e.has_key());
    ASSERT_EQ(*e.get_key(), "five");
    e.set_key("cinq");
    ASSERT_EQ(*e.get_key(), "cinq");
    ASSERT_EQ(e.get_val(), 5);
}

TEST(ResultCollection, MergeKeepsOrder) {
    using namespace pfx;
    result_collection<int> a;
    a.add(result_entry<int>(1, "a"));
    a.add(result_entry<int>(2, "b"));
    result_collection<int> b;
    b.add(result_entry<int>(3, "c"));
    b.add(result_entry<int>(1, "a"));
    a.merge(b);
    ASSERT_EQ(a.size(), 4);
    ASSERT_EQ(b.size(), 2);
    ASSERT_EQ(a.at(0), result_entry<int>(1, "a"));
    ASSERT_EQ(a.at(1), result_entry<int>(2, "b"));
    ASSERT_EQ(a.at(2), result_entry<int>(3, "c"));
    ASSERT_EQ(a.at(3), result_entry<int>(1, "a"));
}

TEST(ResultCollection, MergeEmpty) {
    using namespace pfx;
    result_collection<std::string> a;
    result_collection<std::string> b;
    a.merge(b);
    ASSERT_TRUE(a.empty());
    b.add(result_entry<std::string>("x", "k"));
    a.merge(std::move(b));
    ASSERT_EQ(a.size(), 1);
    size_t n = 0;
    for(const auto& e : a) {
        ASSERT_EQ(e.get_val(), "x");
        n ++;
    }
    ASSERT_EQ(n, 1);
}

TEST(EmitTraits, StoredEntriesKeepTheirKey) {
    using namespace pfx;
    typedef emit_traits<result_entry<int>> traits;
    auto kept = traits::emit(result_entry<int>(7, "original"), "path");
    ASSERT_EQ(*kept.get_key(), "original");
    ASSERT_EQ(kept.get_val(), 7);
    auto labelled = traits::emit(result_entry<int>(8), "path");
    ASSERT_EQ(*labelled.get_key(), "path");
    auto plain = emit_traits<int>::emit(9, "path");
    ASSERT_EQ(plain, result_entry<int>(9, "path"));
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
