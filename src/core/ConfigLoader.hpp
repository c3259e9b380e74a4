#pragma once

#include <filesystem>
#include <string>

#include "core/ValidatorConfig.hpp"
#include "util/Expected.hpp"

namespace commitcheck {

/**
 * @brief Reads ValidatorConfig from a "key = value" file
 *
 * File format:
 *   # comment            (';' also starts a comment)
 *   types = feat, fix, docs, security
 *   footer_tokens = Refs, Closes, Fixes
 *   require_body = false
 *   subject_max_len = 72
 *   body_line_max_len = 100
 *   check_capitalization = off
 *   check_trailing_period = on
 *   check_imperative_mood = no
 *   ignore = Merge *, WIP*
 *
 * Keys not present keep their default. Lists replace the default list.
 * Booleans accept true/false, yes/no, on/off, 1/0.
 * Every result has passed ValidatorConfig::check().
 */
namespace ConfigLoader {

/**
 * @brief Parse config text
 * @param text File contents
 * @param origin Name used in error messages ("<origin>:<line>: ...")
 * @return Config, or InvalidConfig naming the offending line
 */
Expected<ValidatorConfig> loadFromString(const std::string& text, const std::string& origin);

/**
 * @brief Load an explicitly named config file
 * @return Config, IoError if the file cannot be read, or InvalidConfig
 */
Expected<ValidatorConfig> loadFromFile(const std::filesystem::path& path);

/**
 * @brief Load <dir>/.commitcheck when present, built-in defaults otherwise
 */
Expected<ValidatorConfig> loadDefault(const std::filesystem::path& dir);

}  // namespace ConfigLoader

}  // namespace commitcheck
