#ifndef ARGROUND_CONFIG_HPP_
#define ARGROUND_CONFIG_HPP_

#include "arground/common.hpp"
#include <Eigen/Core>
#include <string>

namespace arground
{

struct EstimatorConfig
{
  float max_fallback_distance = 15.0f;
  
  Eigen::Vector2f viewport_center = Eigen::Vector2f(0.5f, 0.5f);
  TrackableType detection_filter = TrackableType::PLANE_WITHIN_POLYGON;
};

struct PlacementConfig
{
  float fallback_forward_offset = 2.0f;
  float fallback_drop = 1.0f;
};

struct ArgroundConfig
{
  EstimatorConfig estimator;
  PlacementConfig placement;
};

// max_fallback_distance must be finite and positive.
bool validateEstimatorConfig(const EstimatorConfig& config);

// Keys absent from the file keep the values already in config.
bool loadConfigFromJSON(const std::string& filename, ArgroundConfig& config);

bool saveConfigToJSON(const std::string& filename, const ArgroundConfig& config);

}

#endif
