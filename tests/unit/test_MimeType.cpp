#include <gtest/gtest.h>
#include "storage/model/MimeType.hpp"

#include <set>

using namespace sbs::storage::model;

TEST(MimeTypeTest, EveryKnownVariantIsTypeSlashSubtype) {
    for (const auto mime : allKnownMimes()) {
        const auto s = to_string(mime);
        ASSERT_FALSE(s.empty());
        const auto slash = s.find('/');
        ASSERT_NE(slash, std::string_view::npos) << s;
        EXPECT_GT(slash, 0u) << s;
        EXPECT_LT(slash, s.size() - 1) << s;
        EXPECT_EQ(s.find('/', slash + 1), std::string_view::npos) << s;
        EXPECT_EQ(s.find(' '), std::string_view::npos) << s;
    }
}

TEST(MimeTypeTest, AllKnownMimesCoversTheEnum) {
    const auto all = allKnownMimes();
    EXPECT_EQ(all.size(), static_cast<size_t>(Mime::SevenZip) + 1);

    const std::set<Mime> unique(all.begin(), all.end());
    EXPECT_EQ(unique.size(), all.size());
}

TEST(MimeTypeTest, WellKnownStrings) {
    EXPECT_EQ(to_string(Mime::PNG), "image/png");
    EXPECT_EQ(to_string(Mime::WAV), "audio/wav");
    EXPECT_EQ(to_string(Mime::JSON), "application/json");
    EXPECT_EQ(to_string(Mime::SevenZip), "application/x-7z-compressed");
}

TEST(MimeTypeTest, CustomReturnsExactlyItsString) {
    EXPECT_EQ(to_string(MimeType{CustomMime{"image/*"}}), "image/*");
    EXPECT_EQ(to_string(MimeType{CustomMime{"application/x-my-thing"}}), "application/x-my-thing");
    EXPECT_EQ(to_string(MimeType{CustomMime{""}}), "");
}

TEST(MimeTypeTest, VariantHoldsKnownByDefaultConversion) {
    const MimeType m = Mime::PDF;
    EXPECT_TRUE(std::holds_alternative<Mime>(m));
    EXPECT_EQ(to_string(m), "application/pdf");
}
