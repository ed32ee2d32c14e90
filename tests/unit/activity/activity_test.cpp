#include <gtest/gtest.h>
#include "presencelink/activity/activity.hpp"
#include "presencelink/activity/activity_builder.hpp"

#include <chrono>

namespace presencelink {
namespace activity {
namespace testing {

using nlohmann::json;

class ActivityTest : public ::testing::Test {
protected:
    static std::string repeat(const std::string& unit, size_t count) {
        std::string out;
        for (size_t i = 0; i < count; ++i) {
            out += unit;
        }
        return out;
    }

    static void expectInvalid(const Activity& activity, const std::string& fragment) {
        auto result = activity.validate();
        ASSERT_TRUE(result.has_error()) << "expected failure mentioning " << fragment;
        EXPECT_EQ(result.error().code(), ErrorCode::InvalidActivity);
        EXPECT_NE(result.error().message().find(fragment), std::string::npos)
            << result.error().message();
    }
};

TEST_F(ActivityTest, EmptyActivityIsValidAndSerializesToEmptyObject) {
    Activity activity;
    EXPECT_TRUE(activity.validate().has_value());
    EXPECT_EQ(json(activity), json::object());
}

TEST_F(ActivityTest, BuilderPopulatesEveryField) {
    auto activity = ActivityBuilder()
        .state("In a match")
        .details("Ranked")
        .startTimestamp(1700000000)
        .endTimestamp(1700003600)
        .largeImage("map_icon")
        .largeText("Dust")
        .smallImage("rank")
        .smallText("Gold")
        .party("party-1", 2, 5)
        .button("Website", "https://example.com")
        .joinSecret("j")
        .spectateSecret("s")
        .matchSecret("m")
        .instance(true)
        .build();

    EXPECT_TRUE(activity.validate().has_value());
    EXPECT_EQ(activity.state(), "In a match");
    ASSERT_TRUE(activity.timestamps().has_value());
    EXPECT_EQ(activity.timestamps()->start, 1700000000u);
    ASSERT_TRUE(activity.party().has_value());
    EXPECT_EQ(activity.party()->size->current, 2u);
    EXPECT_EQ(activity.party()->size->max, 5u);
    ASSERT_EQ(activity.buttons().size(), 1u);
    EXPECT_EQ(activity.instance(), true);

    json expected = {
        {"state", "In a match"},
        {"details", "Ranked"},
        {"timestamps", {{"start", 1700000000}, {"end", 1700003600}}},
        {"assets", {{"large_image", "map_icon"}, {"large_text", "Dust"},
                    {"small_image", "rank"}, {"small_text", "Gold"}}},
        {"party", {{"id", "party-1"}, {"size", {2, 5}}}},
        {"secrets", {{"join", "j"}, {"spectate", "s"}, {"match", "m"}}},
        {"buttons", {{{"label", "Website"}, {"url", "https://example.com"}}}},
        {"instance", true}
    };
    EXPECT_EQ(json(activity), expected);
}

TEST_F(ActivityTest, UnsetFieldsAreOmitted) {
    auto activity = ActivityBuilder().details("Menu").smallImage("icon").build();
    json j = activity;
    EXPECT_EQ(j, (json{{"details", "Menu"}, {"assets", {{"small_image", "icon"}}}}));
    EXPECT_FALSE(j.contains("buttons"));
    EXPECT_FALSE(j.contains("state"));
}

TEST_F(ActivityTest, JsonReadBack) {
    json j = {
        {"state", "Idle"},
        {"timestamps", {{"start", 5}}},
        {"party", {{"size", {1, 4}}}},
        {"buttons", {{{"label", "Join"}, {"url", "http://a.example"}}}}
    };
    Activity activity = j.get<Activity>();
    EXPECT_EQ(activity.state(), "Idle");
    EXPECT_FALSE(activity.details().has_value());
    EXPECT_EQ(activity.timestamps()->start, 5u);
    EXPECT_FALSE(activity.timestamps()->end.has_value());
    EXPECT_FALSE(activity.party()->id.has_value());
    EXPECT_EQ(activity.party()->size->max, 4u);
    EXPECT_EQ(activity.buttons()[0].label, "Join");
    EXPECT_EQ(json(activity), j);
}

TEST_F(ActivityTest, MistypedFieldThrows) {
    json j = {{"state", 42}};
    EXPECT_THROW(j.get<Activity>(), json::exception);
}

TEST_F(ActivityTest, StartTimestampNowIsCurrentTime) {
    const auto before = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    auto activity = ActivityBuilder().startTimestampNow().build();
    const auto after = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();

    ASSERT_TRUE(activity.timestamps()->start.has_value());
    EXPECT_GE(*activity.timestamps()->start, static_cast<uint64_t>(before));
    EXPECT_LE(*activity.timestamps()->start, static_cast<uint64_t>(after));
}

TEST_F(ActivityTest, TextLimitIs128Characters) {
    EXPECT_TRUE(ActivityBuilder().state(std::string(128, 'a')).build().validate().has_value());
    expectInvalid(ActivityBuilder().state(std::string(129, 'a')).build(), "state");
    expectInvalid(ActivityBuilder().details(std::string(129, 'a')).build(), "details");
    expectInvalid(ActivityBuilder().largeText(std::string(129, 'a')).build(), "large_text");
    expectInvalid(ActivityBuilder().smallText(std::string(129, 'a')).build(), "small_text");
    expectInvalid(ActivityBuilder().joinSecret(std::string(129, 'a')).build(), "join secret");
}

TEST_F(ActivityTest, LengthCountsCharactersNotBytes) {
    const std::string accented = repeat("\xC3\xA9", 128);  // U+00E9, two bytes each
    EXPECT_EQ(utf8Length(accented), 128u);
    EXPECT_TRUE(ActivityBuilder().state(accented).build().validate().has_value());
    expectInvalid(ActivityBuilder().state(accented + "e").build(), "got 129");
}

TEST_F(ActivityTest, AssetKeyLimitIs256) {
    EXPECT_TRUE(ActivityBuilder().largeImage(std::string(256, 'k')).build().validate().has_value());
    expectInvalid(ActivityBuilder().largeImage(std::string(257, 'k')).build(), "large_image");
    expectInvalid(ActivityBuilder().smallImage(std::string(257, 'k')).build(), "small_image");
}

TEST_F(ActivityTest, PartySizeCannotExceedMax) {
    EXPECT_TRUE(ActivityBuilder().party("p", 4, 4).build().validate().has_value());
    expectInvalid(ActivityBuilder().party("p", 5, 4).build(), "party size current (5) exceeds max (4)");
    expectInvalid(ActivityBuilder().party(std::string(129, 'p'), 1, 2).build(), "party id");
}

TEST_F(ActivityTest, ButtonRules) {
    auto two = ActivityBuilder()
        .button("One", "https://one.example")
        .button("Two", "http://two.example")
        .build();
    EXPECT_TRUE(two.validate().has_value());

    auto three = ActivityBuilder()
        .button("One", "https://one.example")
        .button("Two", "https://two.example")
        .button("Three", "https://three.example")
        .build();
    expectInvalid(three, "at most 2 buttons allowed (got 3)");

    expectInvalid(ActivityBuilder().button(std::string(33, 'l'), "https://a.example").build(), "button label");
    expectInvalid(ActivityBuilder().button("ok", "https://" + std::string(505, 'u')).build(), "button url");
    expectInvalid(ActivityBuilder().button("ok", "ftp://files.example").build(), "http:// or https://");
}

} // namespace testing
} // namespace activity
} // namespace presencelink
