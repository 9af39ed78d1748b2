#include <gtest/gtest.h>
#include "core/media_item.hpp"

TEST(MediaNamingTest, DefaultNamesDependOnKind)
{
    EXPECT_EQ(MediaNaming::defaultDisplayName(MediaKind::Video), "video.mp4");
    EXPECT_EQ(MediaNaming::defaultDisplayName(MediaKind::Animation), "animation.gif");
}

TEST(MediaNamingTest, ExtensionIsLowerCasedWithDot)
{
    EXPECT_EQ(MediaNaming::extensionOf("Holiday.MOV"), ".mov");
    EXPECT_EQ(MediaNaming::extensionOf("clip.webm"), ".webm");
    EXPECT_EQ(MediaNaming::extensionOf("noext"), "");
}

TEST(MediaNamingTest, CompressedFilesAreAlwaysMp4)
{
    EXPECT_EQ(MediaNaming::outputSuffixFor(MediaKind::Video, "a.mov"), ".mp4");
    EXPECT_EQ(MediaNaming::outputSuffixFor(MediaKind::Animation, "a.gif"), ".mp4");

    EXPECT_EQ(MediaNaming::compressedDisplayName(MediaKind::Video, "holiday.mov"), "holiday.mp4");
    EXPECT_EQ(MediaNaming::compressedDisplayName(MediaKind::Animation, "funny.gif"), "funny.mp4");
    EXPECT_EQ(MediaNaming::compressedDisplayName(MediaKind::Video, "video.mp4"), "video.mp4");
    EXPECT_EQ(MediaNaming::compressedDisplayName(MediaKind::Animation, ""), "animation.mp4");
}

TEST(MediaNamingTest, TokensCarryDecisionAndSequence)
{
    EXPECT_EQ(MediaNaming::encodeToken(Decision::SendOriginal, 12), "original:12");
    EXPECT_EQ(MediaNaming::encodeToken(Decision::Compress, 7), "compress:7");

    auto parsed = MediaNaming::parseToken("compress:7");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->decision, Decision::Compress);
    ASSERT_TRUE(parsed->sequence.has_value());
    EXPECT_EQ(*parsed->sequence, 7u);
}

TEST(MediaNamingTest, BareTokensHaveNoSequence)
{
    auto original = MediaNaming::parseToken("original");
    ASSERT_TRUE(original.has_value());
    EXPECT_EQ(original->decision, Decision::SendOriginal);
    EXPECT_FALSE(original->sequence.has_value());

    auto compress = MediaNaming::parseToken("compress");
    ASSERT_TRUE(compress.has_value());
    EXPECT_EQ(compress->decision, Decision::Compress);
}

TEST(MediaNamingTest, MalformedTokensAreRejected)
{
    EXPECT_FALSE(MediaNaming::parseToken("").has_value());
    EXPECT_FALSE(MediaNaming::parseToken("delete").has_value());
    EXPECT_FALSE(MediaNaming::parseToken("Original").has_value());
    EXPECT_FALSE(MediaNaming::parseToken("compress:").has_value());
    EXPECT_FALSE(MediaNaming::parseToken("compress:-1").has_value());
    EXPECT_FALSE(MediaNaming::parseToken("compress:12a").has_value());
    EXPECT_FALSE(MediaNaming::parseToken("compress:99999999999999999999999").has_value());
}

TEST(MediaNamingTest, NamesForLogs)
{
    EXPECT_STREQ(MediaNaming::kindName(MediaKind::Video), "video");
    EXPECT_STREQ(MediaNaming::kindName(MediaKind::Animation), "animation");
    EXPECT_STREQ(MediaNaming::decisionName(Decision::SendOriginal), "original");
    EXPECT_STREQ(MediaNaming::decisionName(Decision::Compress), "compress");
}
