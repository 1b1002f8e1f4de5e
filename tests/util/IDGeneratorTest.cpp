#include <gtest/gtest.h>

#include "util/IDGenerator.hpp"

#include <set>
#include <string>

namespace walkierelay::util {
namespace test {

namespace {

bool is_crockford(const std::string& s) {
    return s.find_first_not_of("0123456789ABCDEFGHJKMNPQRSTVWXYZ") == std::string::npos;
}

} // namespace

TEST(IDGeneratorTest, ConnectionIdShape) {
    IDGenerator gen;
    const std::string id = gen.connectionID();

    ASSERT_EQ(id.rfind("conn-", 0), 0u);
    const std::string ulid = id.substr(5);
    EXPECT_EQ(ulid.size(), 26u);
    EXPECT_TRUE(is_crockford(ulid)) << ulid;
}

TEST(IDGeneratorTest, UploadNameShape) {
    IDGenerator gen;
    const std::string name = gen.uploadName();

    ASSERT_EQ(name.rfind("upload-", 0), 0u);
    ASSERT_GE(name.size(), 4u);
    EXPECT_EQ(name.substr(name.size() - 4), ".m4a");
    EXPECT_EQ(name.size(), 7u + 26u + 4u);
}

TEST(IDGeneratorTest, IdsAreUniqueAndSortByCreation) {
    IDGenerator gen;
    std::set<std::string> seen;
    std::string previous;

    for (int i = 0; i < 2000; ++i) {
        const std::string id = gen.connectionID();
        EXPECT_TRUE(seen.insert(id).second) << id;
        if (!previous.empty()) {
            EXPECT_LT(previous, id);
        }
        previous = id;
    }
}

} // namespace test
} // namespace walkierelay::util
