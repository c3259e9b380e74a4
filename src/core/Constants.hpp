#pragma once

#include <cstddef>

/**
 * @brief Rule and git-layout constants used throughout the codebase
 *
 * Centralizes magic numbers and literal tokens.
 */
namespace commitcheck {

namespace Constants {
    // Line length limits (code points)
    constexpr size_t SUBJECT_MAX_LEN = 50;        // Conventional 50-character subject
    constexpr size_t BODY_LINE_MAX_LEN = 72;      // Classic 72-column body wrap

    // Footer grammar
    constexpr const char* BREAKING_CHANGE_TOKEN = "BREAKING CHANGE";
    constexpr const char* FOOTER_COLON_SEPARATOR = ": ";
    constexpr const char* FOOTER_HASH_SEPARATOR = " #";

    // Config file looked up in the working directory when --config is absent
    constexpr const char* DEFAULT_CONFIG_FILE = ".commitcheck";

    // Git commit templates drop everything below this line
    constexpr const char* SCISSORS_LINE = "# ------------------------ >8 ------------------------";

    // Git object storage
    constexpr size_t SHA1_HEX_LENGTH = 40;        // SHA-1 produces 40-char hex strings
    constexpr size_t OBJECT_DIR_LENGTH = 2;       // First 2 chars of hash form directory name
    constexpr int MAX_SYMREF_DEPTH = 5;           // HEAD -> ref -> ref ... before giving up
}

}
