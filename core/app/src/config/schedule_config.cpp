#include "cadence/config/schedule_config.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <fstream>
#include <set>
#include <sstream>

namespace cadence {

namespace {

Duration read_sleep(const nlohmann::json& poll, const char* key,
                    Duration fallback) {
  if (!poll.contains(key)) {
    return fallback;
  }
  const auto& value = poll.at(key);
  if (!value.is_number_integer() || value.get<std::int64_t>() <= 0) {
    throw ConfigError(std::string("poll.") + key +
                      " must be a positive integer");
  }
  return Duration{value.get<std::int64_t>()};
}

std::string read_string(const nlohmann::json& entry, const char* key,
                        std::size_t index) {
  const std::string where = "tasks[" + std::to_string(index) + "]." + key;
  if (!entry.contains(key)) {
    throw ConfigError(where + " is missing");
  }
  const auto& value = entry.at(key);
  if (!value.is_string()) {
    throw ConfigError(where + " must be a string");
  }
  return value.get<std::string>();
}

}  // namespace

// -----------------------------------------------------------------------------
// fromJson(): parse, then validate key by key
// -----------------------------------------------------------------------------
ScheduleConfig ScheduleConfig::fromJson(const std::string& text) {
  nlohmann::json root;
  try {
    root = nlohmann::json::parse(text);
  } catch (const nlohmann::json::exception& e) {
    throw ConfigError(std::string("invalid JSON: ") + e.what());
  }

  if (!root.is_object()) {
    throw ConfigError("configuration root must be an object");
  }

  ScheduleConfig config;

  if (root.contains("poll")) {
    const auto& poll = root.at("poll");
    if (!poll.is_object()) {
      throw ConfigError("poll must be an object");
    }
    config.poll.min_sleep =
        read_sleep(poll, "min_sleep_ms", config.poll.min_sleep);
    config.poll.max_sleep =
        read_sleep(poll, "max_sleep_ms", config.poll.max_sleep);
    if (config.poll.min_sleep > config.poll.max_sleep) {
      throw ConfigError("poll.min_sleep_ms exceeds poll.max_sleep_ms");
    }
  }

  if (!root.contains("tasks")) {
    throw ConfigError("tasks is missing");
  }
  const auto& tasks = root.at("tasks");
  if (!tasks.is_array()) {
    throw ConfigError("tasks must be an array");
  }

  std::set<std::string> seen;
  for (std::size_t i = 0; i < tasks.size(); ++i) {
    const auto& entry = tasks.at(i);
    if (!entry.is_object()) {
      throw ConfigError("tasks[" + std::to_string(i) + "] must be an object");
    }

    TaskSpec spec;
    spec.name = read_string(entry, "name", i);
    spec.condition = read_string(entry, "condition", i);
    if (spec.name.empty()) {
      throw ConfigError("tasks[" + std::to_string(i) + "].name is empty");
    }
    if (!seen.insert(spec.name).second) {
      throw ConfigError("duplicate task name '" + spec.name + "'");
    }
    config.tasks.push_back(std::move(spec));
  }

  return config;
}

ScheduleConfig ScheduleConfig::fromFile(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw ConfigError("cannot open configuration file '" + path + "'");
  }
  std::ostringstream contents;
  contents << in.rdbuf();
  return fromJson(contents.str());
}

}  // namespace cadence
