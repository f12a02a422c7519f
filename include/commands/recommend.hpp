#pragma once

#include "outing/Recommender.hpp"

int cmd_recommend(int argc, char** argv);

// --weather_weight / --preference_weight, shared with `group`
outing::RecommendWeights weights_from_args(int argc, char** argv);

// --temp_margin / --air_quality / --half_life_days
outing::RecommendConfig recommend_config_from_args(int argc, char** argv);
