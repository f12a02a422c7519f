#pragma once

#include "outing/Models.hpp"

namespace outing {

struct WeatherScoreConfig {
    // temperature fit decays from 1 at the comfort bound to 0 this far outside it
    double temp_margin_c = 10.0;

    // wind / precipitation sub-scores stay at 1 below fraction * activity maximum
    double wind_comfort_fraction = 0.5;
    double precip_comfort_fraction = 0.5;

    // optional outdoor penalty from the air-quality index (off by default)
    bool air_quality_enabled = false;
    double aqi_good = 50.0;
    double aqi_hazardous = 300.0;
};

struct WeatherScoreBreakdown {
    bool indoor = false;
    double temperature_fit = 0.0;
    double wind_fit = 1.0;          // 1.0 and unused for indoor activities
    double precip_fit = 1.0;        // 1.0 and unused for indoor activities
    double air_quality_factor = 1.0;
    double total = 0.0;
};

// Throws InvalidObservation on non-finite or implausible readings.
void validate_observation(const WeatherObservation& obs);

// Throws InvalidActivity on an incoherent tolerance profile.
void validate_activity(const Activity& activity);

WeatherScoreBreakdown score_weather_detailed(
    const WeatherObservation& obs,
    const Activity& activity,
    const WeatherScoreConfig& cfg = {}
);

double score_weather(
    const WeatherObservation& obs,
    const Activity& activity,
    const WeatherScoreConfig& cfg = {}
);

}  // namespace outing
