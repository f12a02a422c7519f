// Test: preference affinity scoring

#include <gtest/gtest.h>

#include <limits>
#include <vector>

#include "outing/AffinityScorer.hpp"
#include "outing/Errors.hpp"

namespace outing {
namespace test {

static Activity make_activity(const std::string& id, const std::string& category) {
    Activity a;
    a.id = id;
    a.name = id;
    a.category = category;
    return a;
}

static std::vector<Activity> catalog() {
    return {
        make_activity("cinema", "culture"),
        make_activity("hiking", "outdoor-sport"),
        make_activity("museum", "culture"),
        make_activity("trail_run", "outdoor-sport"),
    };
}

TEST(AffinityScorer, ColdStart_IsNeutral) {
    UserProfile p;
    p.user_id = "newbie";

    for (const auto& a : catalog()) {
        EXPECT_DOUBLE_EQ(score_preference(p, a), 0.5);
    }
    EXPECT_TRUE(score_preference_detailed(p, catalog()[0]).cold_start);
}

TEST(AffinityScorer, Exclusion_IsAbsoluteVeto) {
    UserProfile p;
    p.user_id = "u1";
    p.favorites["hiking"] = 5.0;
    p.history["hiking"] = HistoryEntry{12, 0.0};
    p.exclusions.insert("hiking");

    const auto cat = catalog();
    const auto bd = score_preference_detailed(p, cat[1], &cat);
    EXPECT_TRUE(bd.excluded);
    EXPECT_EQ(bd.total, 0.0);
}

TEST(AffinityScorer, Exclusion_AppliesToColdStartUsers) {
    UserProfile p;
    p.user_id = "u1";
    p.exclusions.insert("cinema");

    EXPECT_EQ(score_preference(p, catalog()[0]), 0.0);
    EXPECT_DOUBLE_EQ(score_preference(p, catalog()[1]), 0.5);
}

TEST(AffinityScorer, Favorites_NormalizedByMaxWeight) {
    UserProfile p;
    p.user_id = "u1";
    p.favorites["hiking"] = 2.0;
    p.favorites["cinema"] = 4.0;

    const auto cat = catalog();
    EXPECT_DOUBLE_EQ(score_preference(p, cat[0]), 1.0);   // cinema
    EXPECT_DOUBLE_EQ(score_preference(p, cat[1]), 0.5);   // hiking
    EXPECT_DOUBLE_EQ(score_preference(p, cat[2]), 0.0);   // museum, not a favorite
}

TEST(AffinityScorer, History_RecencyHalvesSignal) {
    const auto cat = catalog();

    UserProfile fresh;
    fresh.user_id = "u1";
    fresh.history["hiking"] = HistoryEntry{1, 0.0};

    UserProfile stale = fresh;
    stale.history["hiking"] = HistoryEntry{1, 30.0};

    // signal 1 -> 1 / (1 + 1); signal 0.5 -> 0.5 / 1.5
    EXPECT_NEAR(score_preference(fresh, cat[1], &cat), 0.5, 1e-12);
    EXPECT_NEAR(score_preference(stale, cat[1], &cat), 1.0 / 3.0, 1e-12);
}

TEST(AffinityScorer, History_MoreFrequentScoresHigher) {
    const auto cat = catalog();

    UserProfile once;
    once.user_id = "u1";
    once.history["museum"] = HistoryEntry{1, 10.0};

    UserProfile often = once;
    often.history["museum"] = HistoryEntry{6, 10.0};

    EXPECT_GT(score_preference(often, cat[2], &cat), score_preference(once, cat[2], &cat));
    EXPECT_LT(score_preference(often, cat[2], &cat), 1.0);
}

TEST(AffinityScorer, History_RelatedActivityCountsThroughCategory) {
    const auto cat = catalog();

    UserProfile p;
    p.user_id = "runner";
    p.history["trail_run"] = HistoryEntry{2, 0.0};

    // related factor 0.5 * count 2 = signal 1
    const auto bd = score_preference_detailed(p, cat[1], &cat);
    EXPECT_NEAR(bd.history_signal, 1.0, 1e-12);
    EXPECT_NEAR(bd.total, 0.5, 1e-12);

    // without a catalog there is no way to relate activities
    EXPECT_DOUBLE_EQ(score_preference(p, cat[1]), 0.0);

    // different category gets nothing
    EXPECT_DOUBLE_EQ(score_preference(p, cat[0], &cat), 0.0);
}

TEST(AffinityScorer, FavoritesAndHistory_Blend) {
    const auto cat = catalog();

    UserProfile p;
    p.user_id = "u1";
    p.favorites["hiking"] = 1.0;
    p.history["hiking"] = HistoryEntry{1, 0.0};

    // 0.6 * 1.0 + 0.4 * 0.5
    EXPECT_NEAR(score_preference(p, cat[1], &cat), 0.8, 1e-12);

    // not a favorite and never done: 0
    EXPECT_DOUBLE_EQ(score_preference(p, cat[0], &cat), 0.0);
}

TEST(AffinityScorer, ZeroCountHistory_IsColdStart) {
    UserProfile p;
    p.user_id = "u1";
    p.history["hiking"] = HistoryEntry{0, 3.0};

    EXPECT_DOUBLE_EQ(score_preference(p, catalog()[0]), 0.5);
}

TEST(AffinityScorer, AlwaysWithinUnitInterval) {
    const auto cat = catalog();

    UserProfile p;
    p.user_id = "heavy";
    p.favorites["hiking"] = 100.0;
    p.favorites["museum"] = 0.001;
    p.history["hiking"] = HistoryEntry{1000, 0.0};
    p.history["trail_run"] = HistoryEntry{500, 1.0};
    p.history["cinema"] = HistoryEntry{3, 400.0};

    for (const auto& a : cat) {
        const double s = score_preference(p, a, &cat);
        EXPECT_GE(s, 0.0);
        EXPECT_LE(s, 1.0);
    }
}

TEST(AffinityScorer, WholeCatalog_MatchesPerActivityScoring) {
    const auto cat = catalog();

    UserProfile p;
    p.user_id = "mixed";
    p.favorites["museum"] = 2.0;
    p.favorites["hiking"] = 1.0;
    p.history["trail_run"] = HistoryEntry{3, 20.0};
    p.history["cinema"] = HistoryEntry{1, 5.0};
    p.exclusions.insert("cinema");

    const auto all = score_preferences(p, cat);
    ASSERT_EQ(all.size(), cat.size());
    for (size_t i = 0; i < cat.size(); ++i) {
        const auto one = score_preference_detailed(p, cat[i], &cat);
        EXPECT_EQ(all[i].total, one.total) << cat[i].id;
        EXPECT_EQ(all[i].excluded, one.excluded) << cat[i].id;
        EXPECT_EQ(all[i].history_signal, one.history_signal) << cat[i].id;
    }

    p.favorites["museum"] = -2.0;
    EXPECT_THROW(score_preferences(p, cat), InvalidProfile);
}

TEST(AffinityScorer, InvalidWeights_Throw) {
    const Activity a = catalog()[0];

    UserProfile p;
    p.user_id = "u1";
    p.favorites["cinema"] = -1.0;
    EXPECT_THROW(score_preference(p, a), InvalidProfile);

    p.favorites["cinema"] = 0.0;
    EXPECT_THROW(score_preference(p, a), InvalidProfile);

    p.favorites["cinema"] = std::numeric_limits<double>::infinity();
    EXPECT_THROW(score_preference(p, a), InvalidProfile);
}

TEST(AffinityScorer, InvalidHistory_Throws) {
    const Activity a = catalog()[0];

    UserProfile p;
    p.user_id = "u1";
    p.history["cinema"] = HistoryEntry{-1, 0.0};
    EXPECT_THROW(score_preference(p, a), InvalidProfile);

    p.history["cinema"] = HistoryEntry{1, -2.0};
    EXPECT_THROW(score_preference(p, a), InvalidProfile);
}

}  // namespace test
}  // namespace outing
