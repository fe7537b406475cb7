/**
 * @file config.cpp
 * @brief Settings document parsing
 */

#include "vidcut/config.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <sstream>

#include <nlohmann/json.hpp>

#include "vidcut/logging.hpp"

using json = nlohmann::json;

namespace vidcut {

namespace {

std::string trim(const std::string &s) {
  size_t b = 0;
  size_t e = s.size();
  while (b < e && std::isspace(static_cast<unsigned char>(s[b])))
    ++b;
  while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1])))
    --e;
  return s.substr(b, e - b);
}

std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return s;
}

bool parse_bool(const std::string &value, bool &out) {
  std::string v = to_lower(value);
  if (v == "true" || v == "1" || v == "yes" || v == "on") {
    out = true;
    return true;
  }
  if (v == "false" || v == "0" || v == "no" || v == "off") {
    out = false;
    return true;
  }
  return false;
}

bool parse_int(const std::string &value, int &out) {
  try {
    size_t pos = 0;
    int v = std::stoi(value, &pos);
    if (pos != value.size())
      return false;
    out = v;
    return true;
  } catch (const std::exception &) {
    return false;
  }
}

bool parse_double(const std::string &value, double &out) {
  try {
    size_t pos = 0;
    double v = std::stod(value, &pos);
    if (pos != value.size() || !std::isfinite(v))
      return false;
    out = v;
    return true;
  } catch (const std::exception &) {
    return false;
  }
}

std::vector<std::string> split_list(const std::string &value) {
  std::vector<std::string> items;
  std::stringstream ss(value);
  std::string item;
  while (std::getline(ss, item, ',')) {
    item = trim(item);
    if (!item.empty())
      items.push_back(item);
  }
  return items;
}

enum class ValueType { String, Bool, Int, Number, List };

struct KeySpec {
  const char *name;
  ValueType type; //< Expected JSON type
};

/// Keys recognized in the document, in documentation order
const KeySpec kKnownKeys[] = {
    {"default_output_dir", ValueType::String},
    {"ffmpeg_path", ValueType::String},
    {"whisper_path", ValueType::String},
    {"whisper_model", ValueType::String},
    {"whisper_models_dir", ValueType::String},
    {"hardware_acceleration", ValueType::Bool},
    {"default_bitrate", ValueType::String},
    {"quality_factor", ValueType::Int},
    {"max_concurrent_jobs", ValueType::Int},
    {"filler_words", ValueType::List},
    {"silence_threshold", ValueType::Number},
};

const KeySpec *find_key(const std::string &key) {
  for (const auto &k : kKnownKeys) {
    if (key == k.name)
      return &k;
  }
  return nullptr;
}

/**
 * @brief Apply one key/value pair.
 * @return 1 if applied, 0 if the key is unknown, -1 if the value is invalid
 */
int apply_value(const std::string &key, const std::string &value,
                Settings &s) {
  if (key == "default_output_dir") {
    s.default_output_dir = value;
  } else if (key == "ffmpeg_path") {
    if (value.empty())
      return -1;
    s.ffmpeg_path = value;
  } else if (key == "whisper_path") {
    if (value.empty())
      return -1;
    s.whisper_path = value;
  } else if (key == "whisper_model") {
    if (value.empty())
      return -1;
    s.whisper_model = value;
  } else if (key == "whisper_models_dir") {
    s.whisper_models_dir = value;
  } else if (key == "hardware_acceleration") {
    if (!parse_bool(value, s.hardware_acceleration))
      return -1;
  } else if (key == "default_bitrate") {
    if (value.empty())
      return -1;
    s.default_bitrate = value;
  } else if (key == "quality_factor") {
    int v = 0;
    if (!parse_int(value, v) || v < 0 || v > 51)
      return -1;
    s.quality_factor = v;
  } else if (key == "max_concurrent_jobs") {
    int v = 0;
    if (!parse_int(value, v) || v < 1)
      return -1;
    s.max_concurrent_jobs = v;
  } else if (key == "filler_words") {
    s.filler_words = split_list(value);
  } else if (key == "silence_threshold") {
    double v = 0;
    if (!parse_double(value, v) || v < 0)
      return -1;
    s.silence_threshold = v;
  } else {
    return 0;
  }
  return 1;
}

/**
 * @brief Apply one JSON member of the document.
 * @return false if the value has the wrong type or fails validation
 */
bool apply_json_value(const KeySpec &key, const json &value, Settings &s) {
  std::string text;
  switch (key.type) {
  case ValueType::String:
    if (!value.is_string())
      return false;
    text = value.get<std::string>();
    break;
  case ValueType::Bool:
    if (!value.is_boolean())
      return false;
    text = value.get<bool>() ? "true" : "false";
    break;
  case ValueType::Int:
    if (!value.is_number_integer())
      return false;
    text = std::to_string(value.get<long long>());
    break;
  case ValueType::Number:
    if (!value.is_number())
      return false;
    text = fmt::format("{}", value.get<double>());
    break;
  case ValueType::List: {
    /// filler_words is the only list
    if (!value.is_array())
      return false;
    std::vector<std::string> items;
    for (const auto &item : value) {
      if (!item.is_string())
        return false;
      std::string word = trim(item.get<std::string>());
      if (!word.empty())
        items.push_back(word);
    }
    s.filler_words = std::move(items);
    return true;
  }
  }
  return apply_value(key.name, text, s) > 0;
}

} // anonymous namespace

int apply_settings(std::istream &in, Settings &settings) {
  json root;
  try {
    root = json::parse(in);
  } catch (const json::parse_error &e) {
    LOG_WARN("Settings document is not valid JSON, ignoring it: {}",
             e.what());
    return 0;
  }
  if (!root.is_object()) {
    LOG_WARN("Settings document must be a JSON object, ignoring it");
    return 0;
  }

  int applied = 0;
  for (auto it = root.begin(); it != root.end(); ++it) {
    const KeySpec *key = find_key(to_lower(it.key()));
    if (!key) {
      LOG_WARN("Settings: unknown key '{}' ignored", it.key());
      continue;
    }
    if (apply_json_value(*key, it.value(), settings)) {
      ++applied;
    } else {
      LOG_WARN("Settings: invalid value {} for '{}', keeping default",
               it.value().dump(), key->name);
    }
  }
  return applied;
}

int apply_env_overrides(Settings &settings) {
  int applied = 0;
  for (const auto &k : kKnownKeys) {
    const char *key = k.name;
    std::string env_name = "VIDCUT_";
    for (const char *p = key; *p; ++p) {
      unsigned char c = static_cast<unsigned char>(*p);
      env_name += static_cast<char>(std::toupper(c));
    }

    const char *val = std::getenv(env_name.c_str());
    if (!val)
      continue;

    if (apply_value(key, trim(val), settings) > 0) {
      ++applied;
    } else {
      LOG_WARN("Invalid value '{}' in {}, ignoring", val, env_name);
    }
  }
  return applied;
}

std::string default_settings_path() {
  namespace fs = std::filesystem;
  if (const char *explicit_path = std::getenv("VIDCUT_CONFIG"))
    return explicit_path;
  if (const char *xdg = std::getenv("XDG_CONFIG_HOME"))
    return (fs::path(xdg) / "vidcut" / "vidcut.json").string();
  if (const char *home = std::getenv("HOME"))
    return (fs::path(home) / ".config" / "vidcut" / "vidcut.json").string();
  return "vidcut.json";
}

Settings load_settings(const std::string &path) {
  Settings settings;
  std::string file = path.empty() ? default_settings_path() : path;

  std::ifstream in(file);
  if (in) {
    int applied = apply_settings(in, settings);
    LOG_DEBUG("Loaded {} settings from {}", applied, file);
  } else if (!path.empty()) {
    LOG_WARN("Settings file not found: {} (using defaults)", file);
  }

  apply_env_overrides(settings);
  return settings;
}

} // namespace vidcut
