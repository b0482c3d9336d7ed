/**
 * @file obsnc_config.cpp
 * @brief Implementation of configuration parsing functions.
 *
 * Parses YAML configuration files using yaml-cpp to populate
 * ObsncConfig structures.
 *
 * @see obsnc_config.hpp for structure definitions
 */

#include "obsnc_config.hpp"
#include "obsnc_errors.hpp"
#include <algorithm>
#include <cctype>
#include <initializer_list>
#include <spdlog/common.h>
#include <stdexcept>
#include <yaml-cpp/yaml.h>

namespace obsnc {

namespace {

std::string to_lower(const std::string &s) {
  std::string result = s;
  std::transform(result.begin(), result.end(), result.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return result;
}

// Matches "yes", "Yes" and "YES" but not "yEs", as YAML 1.1 does.
bool is_yaml11_bool(const std::string &text,
                    std::initializer_list<const char *> words) {
  for (const char *word : words) {
    std::string lower(word);
    std::string title = lower;
    title[0] = static_cast<char>(std::toupper(title[0]));
    std::string upper = lower;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return std::toupper(c); });
    if (text == lower || text == title || text == upper) {
      return true;
    }
  }
  return false;
}

/**
 * @brief Read a sequence of non-empty strings.
 */
std::vector<std::string> parse_path_list(const YAML::Node &node,
                                         const std::string &key,
                                         const std::string &source) {
  if (!node) {
    throw ConfigurationError(source, "missing required key '" + key + "'");
  }
  if (!node.IsSequence()) {
    throw ConfigurationError(source, "'" + key + "' must be a list of paths");
  }

  std::vector<std::string> paths;
  for (const auto &item : node) {
    if (!item.IsScalar() || item.Scalar().empty()) {
      throw ConfigurationError(source, "'" + key +
                                           "' entries must be non-empty "
                                           "path strings");
    }
    paths.push_back(item.Scalar());
  }
  return paths;
}

/**
 * @brief Convert one plain YAML scalar to an attribute value.
 *
 * Quoted scalars stay text. Plain scalars become int64, double, or text,
 * in that order of preference. YAML 1.1 booleans (true/yes/on and
 * false/no/off, in lower, title or upper case) are recognized: a true value
 * is kept as the text "true" and a false value has no value.
 */
std::optional<AttrValue> scalar_to_attr(const YAML::Node &node) {
  const std::string &text = node.Scalar();
  if (node.Tag() == "!") {
    return AttrValue{text};
  }
  if (is_yaml11_bool(text, {"true", "yes", "on"})) {
    return AttrValue{std::string("true")};
  }
  if (is_yaml11_bool(text, {"false", "no", "off"})) {
    return std::nullopt;
  }

  long long ival = 0;
  if (YAML::convert<long long>::decode(node, ival)) {
    return AttrValue{static_cast<std::int64_t>(ival)};
  }
  double dval = 0.0;
  if (YAML::convert<double>::decode(node, dval)) {
    return AttrValue{dval};
  }
  return AttrValue{text};
}

std::optional<AttrValue> node_to_attr(const YAML::Node &node,
                                      const std::string &name,
                                      const std::string &source) {
  if (node.IsNull()) {
    return std::nullopt;
  }
  if (node.IsScalar()) {
    return scalar_to_attr(node);
  }
  if (node.IsSequence()) {
    if (node.size() == 0) {
      return std::nullopt;
    }
    std::string joined;
    for (const auto &item : node) {
      if (!item.IsScalar()) {
        throw ConfigurationError(source, "global attribute '" + name +
                                             "' list entries must be scalars");
      }
      if (!joined.empty()) {
        joined += ", ";
      }
      joined += item.Scalar();
    }
    return AttrValue{joined};
  }
  if (node.IsMap() && node.size() == 0) {
    return std::nullopt;
  }
  throw ConfigurationError(source, "global attribute '" + name +
                                       "' must be a scalar or a list");
}

GlobalAttributes parse_global_attributes(const YAML::Node &node,
                                         const std::string &source) {
  GlobalAttributes attrs;
  if (!node || node.IsNull()) {
    return attrs;
  }
  if (!node.IsMap()) {
    throw ConfigurationError(source,
                             "'global_attributes' must be a mapping");
  }
  for (const auto &kv : node) {
    if (!kv.first.IsScalar() || kv.first.Scalar().empty()) {
      throw ConfigurationError(source,
                               "'global_attributes' keys must be names");
    }
    const std::string name = kv.first.Scalar();
    attrs.emplace_back(name, node_to_attr(kv.second, name, source));
  }
  return attrs;
}

std::string scalar_option(const YAML::Node &node, const std::string &key,
                          const std::string &source) {
  if (!node.IsScalar() && !node.IsNull()) {
    throw ConfigurationError(source,
                             "'converter." + key + "' must be a scalar");
  }
  return node.IsNull() ? std::string() : node.Scalar();
}

ConverterOptions parse_converter_options(const YAML::Node &node,
                                         const std::string &source) {
  ConverterOptions options;
  if (!node || node.IsNull()) {
    return options;
  }
  if (!node.IsMap()) {
    throw ConfigurationError(source, "'converter' must be a mapping");
  }

  for (const auto &kv : node) {
    const std::string key = kv.first.Scalar();
    const std::string value = scalar_option(kv.second, key, source);

    try {
      if (key == "metadata_profile") {
        options.metadata_profile = str_to_metadata_profile(value);
      } else if (key == "numeric_policy") {
        options.numeric_policy = str_to_numeric_policy(value);
      } else if (key == "on_error") {
        options.on_error = str_to_error_policy(value);
      } else if (key == "log_file") {
        options.log_file = value;
      } else if (key == "log_level") {
        std::string lower = to_lower(value);
        if (lower != "off" &&
            spdlog::level::from_str(lower) == spdlog::level::off) {
          throw std::invalid_argument("Unknown log level '" + value + "'");
        }
        options.log_level = lower;
      } else {
        throw std::invalid_argument("Unknown option 'converter." + key + "'");
      }
    } catch (const std::invalid_argument &e) {
      throw ConfigurationError(source, e.what());
    }
  }
  return options;
}

ObsncConfig config_from_node(const YAML::Node &root,
                             const std::string &source) {
  if (!root.IsMap()) {
    throw ConfigurationError(source, "configuration must be a YAML mapping");
  }

  ObsncConfig config;
  config.input_paths = parse_path_list(root["input_path"], "input_path", source);

  auto outputs = parse_path_list(root["output_path"], "output_path", source);
  if (outputs.empty()) {
    throw ConfigurationError(source,
                             "'output_path' must name an output directory");
  }
  config.output_dir = outputs.front();

  config.global_attributes =
      parse_global_attributes(root["global_attributes"], source);
  config.converter = parse_converter_options(root["converter"], source);

  return config;
}

} // namespace

ErrorPolicy str_to_error_policy(const std::string &s) {
  std::string lower = to_lower(s);
  if (lower == "abort" || lower == "stop") {
    return ErrorPolicy::ABORT;
  } else if (lower == "continue" || lower == "skip") {
    return ErrorPolicy::CONTINUE;
  }
  throw std::invalid_argument("Unknown error policy '" + s +
                              "' (expected abort or continue)");
}

std::string error_policy_to_str(ErrorPolicy p) {
  switch (p) {
  case ErrorPolicy::CONTINUE:
    return "continue";
  case ErrorPolicy::ABORT:
  default:
    return "abort";
  }
}

ObsncConfig parse_config(const std::string &yaml_file) {
  YAML::Node root;
  try {
    root = YAML::LoadFile(yaml_file);
  } catch (const YAML::BadFile &) {
    throw ConfigurationError(yaml_file, "cannot read configuration file");
  } catch (const YAML::Exception &e) {
    throw ConfigurationError(yaml_file, e.what());
  }
  return config_from_node(root, yaml_file);
}

ObsncConfig parse_config_string(const std::string &yaml_text,
                                const std::string &source_name) {
  YAML::Node root;
  try {
    root = YAML::Load(yaml_text);
  } catch (const YAML::Exception &e) {
    throw ConfigurationError(source_name, e.what());
  }
  return config_from_node(root, source_name);
}

} // namespace obsnc
