#include <gtest/gtest.h>

#include <string>
#include <unordered_set>

#include "../../src/core/anchor_name_generator.h"

using xanchor::core::AnchorNameGenerator;

static bool IsLowerHex(const std::string& s) {
    for (char c : s) {
        bool digit = c >= '0' && c <= '9';
        bool letter = c >= 'a' && c <= 'f';
        if (!digit && !letter) {
            return false;
        }
    }
    return !s.empty();
}

TEST(AnchorNameGeneratorTest, Generate_Default_PrefixPlusHexSuffix) {
    AnchorNameGenerator generator("anchor/", 4, 16, 7);

    for (int i = 0; i < 50; i++) {
        std::string name = generator.Generate({});
        ASSERT_EQ(name.size(), 11u);
        EXPECT_EQ(name.compare(0, 7, "anchor/"), 0);
        EXPECT_TRUE(IsLowerHex(name.substr(7))) << name;
    }
}

TEST(AnchorNameGeneratorTest, Generate_SameSeed_SameSequence) {
    AnchorNameGenerator first("a/", 6, 16, 1234);
    AnchorNameGenerator second("a/", 6, 16, 1234);

    for (int i = 0; i < 10; i++) {
        EXPECT_EQ(first.Generate({}), second.Generate({}));
    }
}

TEST(AnchorNameGeneratorTest, Generate_TakenNamesAvoided) {
    AnchorNameGenerator generator("n", 1, 500, 99);
    std::unordered_set<std::string> taken;
    for (char c : std::string("0123456789abcde")) {
        taken.insert(std::string("n") + c);
    }

    EXPECT_EQ(generator.Generate(taken), "nf");
}

TEST(AnchorNameGeneratorTest, Generate_EverythingTaken_ReturnsEmpty) {
    AnchorNameGenerator generator("n", 1, 32, 99);
    std::unordered_set<std::string> taken;
    for (char c : std::string("0123456789abcdef")) {
        taken.insert(std::string("n") + c);
    }

    EXPECT_TRUE(generator.Generate(taken).empty());
}

TEST(AnchorNameGeneratorTest, Generate_ZeroSuffixLength_UsesOneDigit) {
    AnchorNameGenerator generator("x-", 0, 0, 5);

    std::string name = generator.Generate({});
    EXPECT_EQ(name.size(), 3u);
}
