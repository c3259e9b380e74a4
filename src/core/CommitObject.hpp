#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace commitcheck {

/**
 * @brief Parsed git commit object
 *
 * Git commit format (after inflating the loose object):
 *   commit <size>\0tree <hash>
 *   parent <hash>
 *   author Name <email> <timestamp> <timezone>
 *   committer Name <email> <timestamp> <timezone>
 *   [gpgsig ... continuation lines start with a space]
 *
 *   <commit message>
 */
struct CommitObject {
    std::string hash;
    std::string treeHash;
    std::vector<std::string> parentHashes;  // 0 for root, 2+ for merges
    std::string authorName;
    std::string authorEmail;
    int64_t authorTimestamp{0};
    std::string authorTimezone;
    std::string message;                    // Raw message, trailing newline kept

    std::string shortHash() const {
        return hash.length() >= 7 ? hash.substr(0, 7) : hash;
    }

    bool isMerge() const { return parentHashes.size() > 1; }
};

}
