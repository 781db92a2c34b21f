#include "arground/config.hpp"
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <cmath>
#include <fstream>

namespace arground
{

namespace
{

bool parseTrackableType(const std::string& name, TrackableType& type)
{
  for (TrackableType candidate : {TrackableType::PLANE_WITHIN_POLYGON,
                                  TrackableType::PLANE_WITHIN_BOUNDS,
                                  TrackableType::PLANE_WITHIN_INFINITY})
  {
    if (toString(candidate) == name)
    {
      type = candidate;
      return true;
    }
  }
  return false;
}

void readFloat(const nlohmann::json& section, const char* key, float& value)
{
  auto it = section.find(key);
  if (it == section.end())
  {
    return;
  }
  
  if (!it->is_number())
  {
    spdlog::warn("Config key '{}' is not a number, keeping {}", key, value);
    return;
  }
  value = it->get<float>();
}

void readEstimator(const nlohmann::json& section, EstimatorConfig& config)
{
  readFloat(section, "max_fallback_distance", config.max_fallback_distance);
  
  auto center = section.find("viewport_center");
  if (center != section.end())
  {
    if (center->is_array() && center->size() == 2 &&
        (*center)[0].is_number() && (*center)[1].is_number())
    {
      config.viewport_center = Eigen::Vector2f((*center)[0].get<float>(),
                                               (*center)[1].get<float>());
    }
    else
    {
      spdlog::warn("Config key 'viewport_center' must be [x, y]");
    }
  }
  
  auto filter = section.find("detection_filter");
  if (filter != section.end())
  {
    if (!filter->is_string() ||
        !parseTrackableType(filter->get<std::string>(), config.detection_filter))
    {
      spdlog::warn("Config key 'detection_filter' has unknown value {}", filter->dump());
    }
  }
}

void readPlacement(const nlohmann::json& section, PlacementConfig& config)
{
  readFloat(section, "fallback_forward_offset", config.fallback_forward_offset);
  readFloat(section, "fallback_drop", config.fallback_drop);
}

}

bool loadConfigFromJSON(const std::string& filename, ArgroundConfig& config)
{
  std::ifstream file(filename);
  if (!file.is_open())
  {
    spdlog::error("Failed to open config file {}", filename);
    return false;
  }
  
  nlohmann::json j = nlohmann::json::parse(file, nullptr, false);
  if (j.is_discarded() || !j.is_object())
  {
    spdlog::error("Config file {} is not a valid JSON object", filename);
    return false;
  }
  
  ArgroundConfig loaded = config;
  
  auto estimator = j.find("estimator");
  if (estimator != j.end() && estimator->is_object())
  {
    readEstimator(*estimator, loaded.estimator);
  }
  
  auto placement = j.find("placement");
  if (placement != j.end() && placement->is_object())
  {
    readPlacement(*placement, loaded.placement);
  }
  
  if (!validateEstimatorConfig(loaded.estimator))
  {
    spdlog::error("Config file {}: max_fallback_distance must be positive", filename);
    return false;
  }
  
  config = loaded;
  spdlog::info("Loaded config from {} (max_fallback_distance={:.1f}m, filter={})",
               filename, config.estimator.max_fallback_distance,
               toString(config.estimator.detection_filter));
  return true;
}

bool validateEstimatorConfig(const EstimatorConfig& config)
{
  return std::isfinite(config.max_fallback_distance) && config.max_fallback_distance > 0.0f;
}

bool saveConfigToJSON(const std::string& filename, const ArgroundConfig& config)
{
  nlohmann::json j;
  
  j["estimator"] = {
    {"max_fallback_distance", config.estimator.max_fallback_distance},
    {"viewport_center", {config.estimator.viewport_center.x(),
                         config.estimator.viewport_center.y()}},
    {"detection_filter", toString(config.estimator.detection_filter)}
  };
  
  j["placement"] = {
    {"fallback_forward_offset", config.placement.fallback_forward_offset},
    {"fallback_drop", config.placement.fallback_drop}
  };
  
  std::ofstream file(filename);
  if (!file.is_open())
  {
    spdlog::error("Failed to write config file {}", filename);
    return false;
  }
  
  file << j.dump(2);
  return true;
}

}
