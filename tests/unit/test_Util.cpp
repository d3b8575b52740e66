#include <gtest/gtest.h>
#include "util/ids.hpp"
#include "util/strings.hpp"
#include "types/ValidationError.hpp"

#include <nlohmann/json.hpp>

using namespace cfi;

TEST(StringsTest, TrimStripsAsciiWhitespace) {
    EXPECT_EQ(util::trim("  \t/a b\r\n"), "/a b");
    EXPECT_EQ(util::trim(std::string("\0x\0", 3)), "x");
    EXPECT_EQ(util::trim("   "), "");
}

TEST(StringsTest, SplitAndJoinLines) {
    EXPECT_EQ(util::splitLines("a\nb\n"), (std::vector<std::string>{"a", "b", ""}));
    EXPECT_EQ(util::splitLines(""), std::vector<std::string>{""});
    EXPECT_EQ(util::joinLines({"/a", "/b"}), "/a\n/b");
    EXPECT_EQ(util::joinLines({}), "");
}

TEST(StringsTest, CaseConversion) {
    EXPECT_EQ(util::toLower("EU-West-2"), "eu-west-2");
    EXPECT_EQ(util::toUpper("e1abc"), "E1ABC");
}

TEST(IdsTest, CrockfordEncoding) {
    const uint8_t bytes[] = {0x00, 0xFF};
    EXPECT_EQ(util::b32_crockford_encode(bytes, sizeof(bytes)), "03ZG");
    EXPECT_EQ(util::b32_crockford_encode(bytes, sizeof(bytes), util::Case::Lower), "03zg");
    EXPECT_EQ(util::b32_crockford_encode(bytes, 0), "");
}

TEST(IdsTest, RandomSuffixUsesCrockfordAlphabet) {
    const auto id = util::random_b32(12);
    ASSERT_EQ(id.size(), 12u);
    EXPECT_EQ(id.find_first_not_of("0123456789abcdefghjkmnpqrstvwxyz"), std::string::npos);
    EXPECT_NE(util::random_b32(12), id);
}

TEST(ValidationErrorTest, JsonCarriesSlugAndField) {
    const types::ValidationError err(types::ValidationError::Code::InvalidRegion, "bad region", "aws_region");
    const nlohmann::json j = err;
    EXPECT_EQ(j.at("code"), "invalid_aws_region");
    EXPECT_EQ(j.at("message"), "bad region");
    EXPECT_EQ(j.at("field"), "aws_region");

    const nlohmann::json noField = types::ValidationError(types::ValidationError::Code::NoValidPaths, "none");
    EXPECT_FALSE(noField.contains("field"));
}
