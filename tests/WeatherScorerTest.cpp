// Test: weather suitability scoring

#include <gtest/gtest.h>

#include <cmath>
#include <limits>

#include "outing/Errors.hpp"
#include "outing/WeatherScorer.hpp"

namespace outing {
namespace test {

static Activity hiking() {
    Activity a;
    a.id = "hiking";
    a.name = "Hiking";
    a.category = "outdoor-sport";
    a.tolerance = ToleranceProfile{10.0, 30.0, 20.0, 0.3};
    a.indoor = false;
    return a;
}

static Activity museum() {
    Activity a;
    a.id = "museum";
    a.name = "Museum visit";
    a.category = "culture";
    a.tolerance = ToleranceProfile{5.0, 15.0, 80.0, 1.0};
    a.indoor = true;
    return a;
}

static WeatherObservation mildDay() {
    WeatherObservation w;
    w.location = "Lyon";
    w.timestamp = "2024-06-01T10:00:00Z";
    w.temperature_c = 22.0;
    w.wind_kmh = 5.0;
    w.precip_probability = 0.05;
    return w;
}

// ========== Scenarios ==========

TEST(WeatherScorer, Hiking_MildDay_ScoresOne) {
    const auto bd = score_weather_detailed(mildDay(), hiking());

    EXPECT_DOUBLE_EQ(bd.temperature_fit, 1.0);
    EXPECT_DOUBLE_EQ(bd.wind_fit, 1.0);
    EXPECT_DOUBLE_EQ(bd.precip_fit, 1.0);
    EXPECT_DOUBLE_EQ(score_weather(mildDay(), hiking()), 1.0);
}

TEST(WeatherScorer, Indoor_UsesTemperatureFitOnly) {
    // 22 C is 7 C above the museum's range: 1 - 7/10
    WeatherObservation storm = mildDay();
    storm.wind_kmh = 120.0;
    storm.precip_probability = 1.0;

    const auto calm = score_weather_detailed(mildDay(), museum());
    const auto wild = score_weather_detailed(storm, museum());

    EXPECT_TRUE(calm.indoor);
    EXPECT_NEAR(calm.temperature_fit, 0.3, 1e-12);
    EXPECT_NEAR(calm.total, calm.temperature_fit, 1e-12);
    EXPECT_NEAR(wild.total, calm.total, 1e-12);
}

// ========== Sub-scores ==========

TEST(WeatherScorer, Temperature_DecaysLinearlyOutsideRange) {
    WeatherObservation w = mildDay();
    w.temperature_c = 35.0;  // 5 C above 30
    EXPECT_NEAR(score_weather_detailed(w, hiking()).temperature_fit, 0.5, 1e-12);
    EXPECT_NEAR(score_weather(w, hiking()), (0.5 + 1.0 + 1.0) / 3.0, 1e-12);

    w.temperature_c = 0.0;  // 10 C below 10: at the margin
    EXPECT_DOUBLE_EQ(score_weather_detailed(w, hiking()).temperature_fit, 0.0);

    w.temperature_c = -20.0;
    EXPECT_DOUBLE_EQ(score_weather_detailed(w, hiking()).temperature_fit, 0.0);
}

TEST(WeatherScorer, Wind_FullBelowComfort_ZeroAtMax) {
    WeatherObservation w = mildDay();

    w.wind_kmh = 10.0;
    EXPECT_DOUBLE_EQ(score_weather_detailed(w, hiking()).wind_fit, 1.0);

    w.wind_kmh = 15.0;
    EXPECT_NEAR(score_weather_detailed(w, hiking()).wind_fit, 0.5, 1e-12);

    w.wind_kmh = 20.0;
    EXPECT_DOUBLE_EQ(score_weather_detailed(w, hiking()).wind_fit, 0.0);

    w.wind_kmh = 45.0;
    EXPECT_DOUBLE_EQ(score_weather_detailed(w, hiking()).wind_fit, 0.0);
}

TEST(WeatherScorer, Precipitation_DecaysToActivityTolerance) {
    WeatherObservation w = mildDay();

    w.precip_probability = 0.0;
    EXPECT_DOUBLE_EQ(score_weather_detailed(w, hiking()).precip_fit, 1.0);

    w.precip_probability = 0.225;
    EXPECT_NEAR(score_weather_detailed(w, hiking()).precip_fit, 0.5, 1e-12);

    w.precip_probability = 0.3;
    EXPECT_DOUBLE_EQ(score_weather_detailed(w, hiking()).precip_fit, 0.0);

    w.precip_probability = 0.9;
    EXPECT_DOUBLE_EQ(score_weather_detailed(w, hiking()).precip_fit, 0.0);
}

TEST(WeatherScorer, Precipitation_ZeroTolerance_AnyChanceScoresZero) {
    Activity a = hiking();
    a.tolerance.max_precip_probability = 0.0;

    WeatherObservation w = mildDay();
    w.precip_probability = 0.0;
    EXPECT_DOUBLE_EQ(score_weather_detailed(w, a).precip_fit, 1.0);

    w.precip_probability = 0.01;
    EXPECT_DOUBLE_EQ(score_weather_detailed(w, a).precip_fit, 0.0);
}

TEST(WeatherScorer, AirQuality_OnlyWhenEnabled) {
    WeatherObservation w = mildDay();
    w.air_quality_index = 175.0;  // halfway between 50 and 300

    EXPECT_DOUBLE_EQ(score_weather(w, hiking()), 1.0);

    WeatherScoreConfig cfg;
    cfg.air_quality_enabled = true;
    EXPECT_NEAR(score_weather(w, hiking(), cfg), 0.5, 1e-12);

    // indoor activities are never penalized by air quality
    EXPECT_NEAR(score_weather(w, museum(), cfg), score_weather(w, museum()), 1e-12);
}

TEST(WeatherScorer, AlwaysWithinUnitInterval) {
    const Activity acts[] = {hiking(), museum()};
    for (const auto& a : acts) {
        for (double t = -60.0; t <= 60.0; t += 7.5) {
            for (double wind = 0.0; wind <= 120.0; wind += 12.0) {
                for (double p = 0.0; p <= 1.0; p += 0.125) {
                    WeatherObservation w;
                    w.temperature_c = t;
                    w.wind_kmh = wind;
                    w.precip_probability = p;

                    const double s = score_weather(w, a);
                    EXPECT_GE(s, 0.0);
                    EXPECT_LE(s, 1.0);
                }
            }
        }
    }
}

TEST(WeatherScorer, Deterministic) {
    WeatherObservation w = mildDay();
    w.temperature_c = 31.3;
    w.wind_kmh = 13.7;
    EXPECT_EQ(score_weather(w, hiking()), score_weather(w, hiking()));
}

// ========== Validation ==========

TEST(WeatherScorer, OutOfRangeObservation_Throws) {
    WeatherObservation w = mildDay();
    w.temperature_c = 70.0;
    EXPECT_THROW(score_weather(w, hiking()), InvalidObservation);

    w = mildDay();
    w.temperature_c = std::numeric_limits<double>::quiet_NaN();
    EXPECT_THROW(score_weather(w, hiking()), InvalidObservation);

    w = mildDay();
    w.wind_kmh = -1.0;
    EXPECT_THROW(score_weather(w, hiking()), InvalidObservation);

    w = mildDay();
    w.precip_probability = 1.5;
    EXPECT_THROW(score_weather(w, museum()), InvalidObservation);

    w = mildDay();
    w.air_quality_index = 600.0;
    EXPECT_THROW(score_weather(w, hiking()), InvalidObservation);
}

TEST(WeatherScorer, InvalidObservation_IsEngineError) {
    WeatherObservation w = mildDay();
    w.precip_probability = -0.1;
    try {
        validate_observation(w);
        FAIL() << "expected InvalidObservation";
    } catch (const EngineError& e) {
        EXPECT_EQ(e.code(), ErrorCode::InvalidObservation);
    }
}

TEST(WeatherScorer, IncoherentTolerance_Throws) {
    Activity a = hiking();
    a.tolerance.temp_min = 35.0;
    EXPECT_THROW(score_weather(mildDay(), a), InvalidActivity);

    a = hiking();
    a.tolerance.max_wind_kmh = 0.0;
    EXPECT_THROW(score_weather(mildDay(), a), InvalidActivity);
}

}  // namespace test
}  // namespace outing
