#pragma once

#include <filesystem>
#include <string>

#include "core/CommitObject.hpp"
#include "util/Expected.hpp"

namespace commitcheck {

/**
 * @brief Read-only access to commits in a real git repository
 *
 * Supplies the message of an existing commit to the validator without
 * spawning git. Only what that needs is supported:
 *
 *   HEAD / refs   .git/HEAD, loose refs under .git/refs, .git/packed-refs
 *   objects       loose objects .git/objects/<aa>/<38 hex>, zlib-compressed
 *
 * Packed objects (.git/objects/pack) are reported as UnsupportedObject.
 *
 * Object format (after inflate): "<type> <size>\0<content>"
 */
class GitObjectReader {
public:
    /// @param gitDir The .git directory itself, not the work tree
    explicit GitObjectReader(const std::filesystem::path& gitDir);

    /**
     * @brief Find the git directory for a path inside a work tree
     * @param start Directory to start from; parents are searched upwards
     * @return Path of the .git directory, or NotARepository
     *
     * A ".git" file holding "gitdir: <path>" (worktrees, submodules) is followed.
     */
    static Expected<std::filesystem::path> discoverGitDir(const std::filesystem::path& start);

    /**
     * @brief Resolve a ref name ("HEAD", "refs/heads/main") to a commit hash
     * @return 40-char hex hash, RefNotFound, or CorruptObject for garbage refs
     */
    Expected<std::string> resolveRef(const std::string& name) const;

    /**
     * @brief Inflate and parse a commit object
     * @return CommitObject, or ObjectNotFound / UnsupportedObject / CorruptObject
     */
    Expected<CommitObject> readCommit(const std::string& hash) const;

    /// resolveRef("HEAD") followed by readCommit
    Expected<CommitObject> readHead() const;

    /// .git/objects/<aa>/<rest>
    std::filesystem::path objectPath(const std::string& hash) const;

    const std::filesystem::path& gitDir() const { return dir; }

private:
    Expected<std::string> resolveRefDepth(const std::string& name, int depth) const;
    Expected<std::string> lookupPackedRef(const std::string& name) const;
    std::string inflateObject(const std::string& hash) const;

    std::filesystem::path dir;
};

/// 40 lowercase or uppercase hex digits
bool isObjectHash(const std::string& text);

}
