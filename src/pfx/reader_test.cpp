#include <gtest/gtest.h>

#include <string>
#include <sstream>
#include <fstream>
#include <stdexcept>

#include <pfx/reader.hpp>

TEST(Reader, ReadsKeyValueLines) {
    using namespace pfx;
    std::istringstream in("apple\tfruit\n"
                          "apply\tverb\n"
                          "\n"
                          "apple\tcompany\r\n"
                          "ape\n");
    dictionary dict;
    ASSERT_EQ(read_dictionary(in, dict), 4);
    ASSERT_EQ(dict.num_keys(), 3);
    ASSERT_EQ(dict.get_vals("apple").size(), 2);
    ASSERT_EQ(dict.get_vals("apple").at(1), "company");
    ASSERT_EQ(dict.get_vals("ape").at(0), "");
    ASSERT_EQ(dict.search("app").size(), 3);
}

TEST(Reader, RejectsMalformedLines) {
    using namespace pfx;
    {
        std::istringstream in("a\tb\tc\n");
        dictionary dict;
        ASSERT_THROW(read_dictionary(in, dict), std::runtime_error);
    }
    {
        std::istringstream in("ok\t1\n\tvalue\n");
        dictionary dict;
        ASSERT_THROW(read_dictionary(in, dict), std::runtime_error);
        ASSERT_TRUE(dict.is_member("ok"));
    }
}

TEST(Reader, ReadsFromPath) {
    using namespace pfx;
    std::string fn {"/tmp/pfx_reader_test.tsv"};
    {
        std::ofstream os(fn);
        os << "route/a\tA\nroute/b\tB\n";
    }
    dictionary dict;
    ASSERT_EQ(read_dictionary(fn, dict), 2);
    ASSERT_TRUE(dict.is_member("route/b"));
    ASSERT_THROW(read_dictionary(std::string("/nonexistent/pfx.tsv"), dict),
                 std::runtime_error);
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
