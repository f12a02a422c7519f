#include "outing/WeatherScorer.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

#include "outing/Errors.hpp"

namespace outing {

static constexpr double kMinTemperatureC = -60.0;
static constexpr double kMaxTemperatureC = 60.0;
static constexpr double kMaxWindKmh = 400.0;
static constexpr double kMaxAqi = 500.0;

static double clamp01(double x) {
    if (x < 0.0) return 0.0;
    if (x > 1.0) return 1.0;
    return x;
}

// 1 up to full_until, linear down to 0 at zero_at, 0 beyond.
static double ramp_down(double x, double full_until, double zero_at) {
    if (x <= full_until) return 1.0;
    if (x >= zero_at) return 0.0;
    return clamp01((zero_at - x) / (zero_at - full_until));
}

static void check_range(double v, double lo, double hi, const char* field) {
    if (!std::isfinite(v) || v < lo || v > hi) {
        std::ostringstream oss;
        oss << field << " = " << v << " outside [" << lo << ", " << hi << "]";
        throw InvalidObservation(oss.str());
    }
}

void validate_observation(const WeatherObservation& obs) {
    check_range(obs.temperature_c, kMinTemperatureC, kMaxTemperatureC, "temperature_c");
    check_range(obs.wind_kmh, 0.0, kMaxWindKmh, "wind_kmh");
    check_range(obs.precip_probability, 0.0, 1.0, "precip_probability");
    if (obs.air_quality_index) {
        check_range(*obs.air_quality_index, 0.0, kMaxAqi, "air_quality_index");
    }
}

void validate_activity(const Activity& activity) {
    const ToleranceProfile& t = activity.tolerance;
    const std::string who = "activity '" + activity.id + "': ";

    if (activity.id.empty()) throw InvalidActivity("activity id must not be empty");
    if (!std::isfinite(t.temp_min) || !std::isfinite(t.temp_max) || t.temp_min > t.temp_max) {
        throw InvalidActivity(who + "temperature range must be finite with temp_min <= temp_max");
    }
    if (!std::isfinite(t.max_wind_kmh) || t.max_wind_kmh <= 0.0) {
        throw InvalidActivity(who + "max_wind_kmh must be > 0");
    }
    if (!std::isfinite(t.max_precip_probability) || t.max_precip_probability < 0.0 ||
        t.max_precip_probability > 1.0) {
        throw InvalidActivity(who + "max_precip_probability must be in [0, 1]");
    }
}

static double temperature_fit(double temp, const ToleranceProfile& t, double margin) {
    double outside = 0.0;
    if (temp < t.temp_min) outside = t.temp_min - temp;
    else if (temp > t.temp_max) outside = temp - t.temp_max;

    if (outside <= 0.0) return 1.0;
    if (margin <= 0.0) return 0.0;
    return clamp01(1.0 - outside / margin);
}

static double wind_fit(double wind, const ToleranceProfile& t, double comfort_fraction) {
    const double limit = t.max_wind_kmh;
    const double comfort = limit * clamp01(comfort_fraction);
    if (comfort >= limit) return wind < limit ? 1.0 : 0.0;
    return ramp_down(wind, comfort, limit);
}

static double precip_fit(double p, const ToleranceProfile& t, double comfort_fraction) {
    const double limit = std::min(1.0, t.max_precip_probability);
    if (limit <= 0.0) return p <= 0.0 ? 1.0 : 0.0;

    const double comfort = limit * clamp01(comfort_fraction);
    if (comfort >= limit) return p < limit ? 1.0 : 0.0;
    return ramp_down(p, comfort, limit);
}

WeatherScoreBreakdown score_weather_detailed(
    const WeatherObservation& obs,
    const Activity& activity,
    const WeatherScoreConfig& cfg
) {
    validate_observation(obs);
    validate_activity(activity);

    WeatherScoreBreakdown out;
    out.indoor = activity.indoor;
    out.temperature_fit = temperature_fit(obs.temperature_c, activity.tolerance, cfg.temp_margin_c);

    // Indoor activities only care about getting there comfortably.
    if (activity.indoor) {
        out.total = out.temperature_fit;
        return out;
    }

    out.wind_fit = wind_fit(obs.wind_kmh, activity.tolerance, cfg.wind_comfort_fraction);
    out.precip_fit = precip_fit(obs.precip_probability, activity.tolerance, cfg.precip_comfort_fraction);

    double total = (out.temperature_fit + out.wind_fit + out.precip_fit) / 3.0;

    if (cfg.air_quality_enabled && obs.air_quality_index) {
        out.air_quality_factor = ramp_down(*obs.air_quality_index, cfg.aqi_good, cfg.aqi_hazardous);
        total *= out.air_quality_factor;
    }

    out.total = clamp01(total);
    return out;
}

double score_weather(
    const WeatherObservation& obs,
    const Activity& activity,
    const WeatherScoreConfig& cfg
) {
    return score_weather_detailed(obs, activity, cfg).total;
}

}  // namespace outing
