#include "core/ConfigLoader.hpp"

#include <cstdlib>
#include <fstream>
#include <optional>
#include <sstream>

#include "core/Constants.hpp"
#include "util/Logger.hpp"
#include "util/StringUtils.hpp"

namespace fs = std::filesystem;

namespace commitcheck {
namespace ConfigLoader {

namespace {

std::optional<bool> parseBool(const std::string& raw) {
    const std::string v = StringUtils::toLower(raw);
    if (v == "true" || v == "yes" || v == "on" || v == "1") return true;
    if (v == "false" || v == "no" || v == "off" || v == "0") return false;
    return std::nullopt;
}

std::optional<size_t> parsePositive(const std::string& raw) {
    if (raw.empty() || raw[0] == '-' || raw[0] == '+') return std::nullopt;
    char* end = nullptr;
    unsigned long value = std::strtoul(raw.c_str(), &end, 10);
    if (end == nullptr || *end != '\0' || value == 0) return std::nullopt;
    return static_cast<size_t>(value);
}

Error lineError(const std::string& origin, size_t lineNo, const std::string& what) {
    std::ostringstream oss;
    oss << origin << ":" << lineNo << ": " << what;
    return Error{ErrorCode::InvalidConfig, oss.str()};
}

}

Expected<ValidatorConfig> loadFromString(const std::string& text, const std::string& origin) {
    ValidatorConfig cfg = ValidatorConfig::defaults();

    std::istringstream in(text);
    std::string line;
    size_t lineNo = 0;
    while (std::getline(in, line)) {
        ++lineNo;
        std::string trimmed = StringUtils::trim(line);
        if (trimmed.empty() || trimmed[0] == '#' || trimmed[0] == ';') continue;

        size_t eq = trimmed.find('=');
        if (eq == std::string::npos) {
            return lineError(origin, lineNo, "expected key = value");
        }
        std::string key = StringUtils::toLower(StringUtils::trim(trimmed.substr(0, eq)));
        std::string value = StringUtils::trim(trimmed.substr(eq + 1));

        if (key == "types") {
            cfg.validTypes = StringUtils::splitList(value, ',');
        } else if (key == "footer_tokens") {
            cfg.footerTokens = StringUtils::splitList(value, ',');
        } else if (key == "ignore") {
            cfg.ignorePatterns = StringUtils::splitList(value, ',');
        } else if (key == "subject_max_len" || key == "body_line_max_len") {
            auto n = parsePositive(value);
            if (!n) return lineError(origin, lineNo, key + " must be a positive integer");
            (key == "subject_max_len" ? cfg.subjectMaxLen : cfg.bodyLineMaxLen) = *n;
        } else if (key == "require_body" || key == "check_capitalization" ||
                   key == "check_trailing_period" || key == "check_imperative_mood") {
            auto b = parseBool(value);
            if (!b) return lineError(origin, lineNo, key + " must be a boolean");
            if (key == "require_body") cfg.requireBody = *b;
            else if (key == "check_capitalization") cfg.checkCapitalization = *b;
            else if (key == "check_trailing_period") cfg.checkTrailingPeriod = *b;
            else cfg.checkImperativeMood = *b;
        } else {
            return lineError(origin, lineNo, "unknown key '" + key + "'");
        }
    }

    auto valid = cfg.check();
    if (!valid) {
        return Error{ErrorCode::InvalidConfig, origin + ": " + valid.error().message};
    }
    return cfg;
}

Expected<ValidatorConfig> loadFromFile(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return Error{ErrorCode::IoError, "Cannot read config file: " + path.string()};
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) {
        return Error{ErrorCode::IoError, "Error reading config file: " + path.string()};
    }
    Logger::instance().debug("Loading config from " + path.string());
    return loadFromString(buffer.str(), path.string());
}

Expected<ValidatorConfig> loadDefault(const fs::path& dir) {
    fs::path candidate = dir / Constants::DEFAULT_CONFIG_FILE;
    std::error_code ec;
    if (fs::is_regular_file(candidate, ec)) {
        return loadFromFile(candidate);
    }
    Logger::instance().debug("No " + std::string(Constants::DEFAULT_CONFIG_FILE) + " found, using defaults");
    return ValidatorConfig::defaults();
}

}  // namespace ConfigLoader
}  // namespace commitcheck
