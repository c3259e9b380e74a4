#pragma once

#include <filesystem>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace commitcheck::test {

/**
 * @brief Test utilities for commitcheck tests
 *
 * Temporary directories and files, hand-built git repositories with loose
 * objects, and stdout capture for command output.
 */
namespace utils {

/**
 * @brief Create a temporary directory for testing
 * @return Path to temporary directory
 */
std::filesystem::path createTempDir();

/**
 * @brief Remove a directory and all its contents
 * @param dir Directory to remove
 */
void removeDir(const std::filesystem::path& dir);

/**
 * @brief Create a file with content in the given directory
 * @return Full path to created file
 */
std::filesystem::path createFile(
    const std::filesystem::path& baseDir,
    const std::string& filename,
    const std::string& content = ""
);

/**
 * @brief Create the skeleton of a git repository
 * @param workTree Directory that receives the .git directory
 * @return Path of the .git directory
 *
 * Creates .git/objects, .git/refs/heads and HEAD -> refs/heads/main.
 */
std::filesystem::path initGitRepo(const std::filesystem::path& workTree);

/**
 * @brief Store a loose object the way git does: zlib("<type> <size>\0<content>")
 * @param gitDir .git directory
 * @param hash 40-char name to store it under (not verified by the reader)
 */
void writeLooseObject(
    const std::filesystem::path& gitDir,
    const std::string& hash,
    const std::string& type,
    const std::string& content
);

/**
 * @brief Store a commit object with a fixed tree and author
 * @param parents Parent hashes, empty for a root commit
 */
void writeCommitObject(
    const std::filesystem::path& gitDir,
    const std::string& hash,
    const std::string& message,
    const std::vector<std::string>& parents = {}
);

/// Point refs/heads/<branch> at hash
void setBranch(const std::filesystem::path& gitDir, const std::string& branch, const std::string& hash);

/**
 * @brief Redirects std::cout into a buffer for the lifetime of the object
 */
class CoutCapture {
public:
    CoutCapture() : old(std::cout.rdbuf(buffer.rdbuf())) {}
    ~CoutCapture() { std::cout.rdbuf(old); }
    CoutCapture(const CoutCapture&) = delete;
    CoutCapture& operator=(const CoutCapture&) = delete;

    std::string str() const { return buffer.str(); }

private:
    std::ostringstream buffer;
    std::streambuf* old;
};

} // namespace utils

} // namespace commitcheck::test
