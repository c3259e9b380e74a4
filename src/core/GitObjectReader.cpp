#include "core/GitObjectReader.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iterator>
#include <sstream>
#include <stdexcept>
#include <vector>

#include "core/Constants.hpp"
#include "util/Logger.hpp"
#include "util/StringUtils.hpp"

#include <zlib.h>

namespace fs = std::filesystem;

namespace commitcheck {

namespace {
    /**
     * @brief Inflate a zlib stream (git stores loose objects deflated)
     */
    std::string zlibDecompress(const std::vector<uint8_t>& compressed) {
        z_stream stream{};
        stream.zalloc = Z_NULL;
        stream.zfree = Z_NULL;
        stream.opaque = Z_NULL;

        if (inflateInit(&stream) != Z_OK) {
            throw std::runtime_error("zlib inflateInit failed");
        }

        stream.avail_in = static_cast<uInt>(compressed.size());
        stream.next_in = const_cast<Bytef*>(compressed.data());

        std::string decompressed;
        std::vector<uint8_t> buffer(4096);

        int ret;
        do {
            stream.avail_out = static_cast<uInt>(buffer.size());
            stream.next_out = buffer.data();

            ret = inflate(&stream, Z_NO_FLUSH);
            if (ret != Z_OK && ret != Z_STREAM_END) {
                inflateEnd(&stream);
                throw std::runtime_error("zlib inflate failed");
            }
            size_t have = buffer.size() - stream.avail_out;
            if (ret == Z_OK && have == 0 && stream.avail_in == 0) {
                // Input exhausted before the end of the stream
                inflateEnd(&stream);
                throw std::runtime_error("zlib stream truncated");
            }
            decompressed.append(reinterpret_cast<char*>(buffer.data()), have);
        } while (ret != Z_STREAM_END);

        inflateEnd(&stream);
        return decompressed;
    }

    std::string readFirstLine(const fs::path& path) {
        std::ifstream in(path);
        std::string line;
        std::getline(in, line);
        return StringUtils::trim(line);
    }

    /// "Name <email> 1700000000 +0100"
    void parseIdentity(const std::string& text, CommitObject& commit) {
        size_t emailStart = text.find('<');
        size_t emailEnd = text.find('>');
        if (emailStart == std::string::npos || emailEnd == std::string::npos || emailEnd < emailStart) {
            return;
        }
        commit.authorName = StringUtils::trim(text.substr(0, emailStart));
        commit.authorEmail = text.substr(emailStart + 1, emailEnd - emailStart - 1);
        std::istringstream rest(text.substr(emailEnd + 1));
        rest >> commit.authorTimestamp >> commit.authorTimezone;
    }
}

bool isObjectHash(const std::string& text) {
    return text.length() == Constants::SHA1_HEX_LENGTH &&
           std::all_of(text.begin(), text.end(),
                       [](char c) { return std::isxdigit(static_cast<unsigned char>(c)); });
}

GitObjectReader::GitObjectReader(const fs::path& gitDir) : dir(gitDir) {}

Expected<fs::path> GitObjectReader::discoverGitDir(const fs::path& start) {
    std::error_code ec;
    fs::path cur = fs::absolute(start, ec);
    if (ec) {
        return Error{ErrorCode::IoError, "Cannot resolve path " + start.string() + ": " + ec.message()};
    }
    while (true) {
        fs::path candidate = cur / ".git";
        if (fs::is_directory(candidate, ec)) {
            return candidate;
        }
        if (fs::is_regular_file(candidate, ec)) {
            std::string line = readFirstLine(candidate);
            if (!StringUtils::startsWith(line, "gitdir:")) {
                return Error{ErrorCode::NotARepository, "Malformed .git file: " + candidate.string()};
            }
            fs::path target = StringUtils::trim(line.substr(7));
            return target.is_absolute() ? target : (cur / target).lexically_normal();
        }
        if (!cur.has_parent_path() || cur == cur.parent_path()) {
            return Error{ErrorCode::NotARepository, "Not inside a git repository: " + start.string()};
        }
        cur = cur.parent_path();
    }
}

fs::path GitObjectReader::objectPath(const std::string& hash) const {
    std::string lower = StringUtils::toLower(hash);
    return dir / "objects" / lower.substr(0, Constants::OBJECT_DIR_LENGTH) /
           lower.substr(Constants::OBJECT_DIR_LENGTH);
}

Expected<std::string> GitObjectReader::resolveRef(const std::string& name) const {
    return resolveRefDepth(name, 0);
}

Expected<std::string> GitObjectReader::resolveRefDepth(const std::string& name, int depth) const {
    if (depth > Constants::MAX_SYMREF_DEPTH) {
        return Error{ErrorCode::CorruptObject, "Symbolic ref chain too deep at " + name};
    }
    if (isObjectHash(name)) {
        return StringUtils::toLower(name);
    }

    fs::path refFile = dir / name;
    std::error_code ec;
    if (!fs::is_regular_file(refFile, ec)) {
        return lookupPackedRef(name);
    }

    std::string content = readFirstLine(refFile);
    if (StringUtils::startsWith(content, "ref: ")) {
        std::string target = StringUtils::trim(content.substr(5));
        Logger::instance().debug(name + " -> " + target);
        return resolveRefDepth(target, depth + 1);
    }
    if (isObjectHash(content)) {
        return StringUtils::toLower(content);
    }
    if (content.empty()) {
        return Error{ErrorCode::RefNotFound, name + " does not point to a commit yet"};
    }
    return Error{ErrorCode::CorruptObject, "Invalid ref content in " + refFile.string()};
}

Expected<std::string> GitObjectReader::lookupPackedRef(const std::string& name) const {
    std::ifstream in(dir / "packed-refs");
    if (in) {
        // "<hash> <refname>" lines; '#' header and '^' peeled lines are skipped
        std::string line;
        while (std::getline(in, line)) {
            if (line.empty() || line[0] == '#' || line[0] == '^') continue;
            size_t space = line.find(' ');
            if (space == std::string::npos) continue;
            if (StringUtils::trim(line.substr(space + 1)) == name) {
                std::string hash = line.substr(0, space);
                if (isObjectHash(hash)) return StringUtils::toLower(hash);
            }
        }
    }
    return Error{ErrorCode::RefNotFound, "Ref not found: " + name};
}

std::string GitObjectReader::inflateObject(const std::string& hash) const {
    fs::path objPath = objectPath(hash);
    std::ifstream in(objPath, std::ios::binary);
    if (!in) {
        throw std::runtime_error("Failed to open object file for reading: " + hash);
    }
    std::vector<uint8_t> compressed((std::istreambuf_iterator<char>(in)),
                                    std::istreambuf_iterator<char>());
    if (in.bad()) {
        throw std::runtime_error("Error reading object file: " + hash);
    }
    if (compressed.empty()) {
        throw std::runtime_error("Object file is empty: " + hash);
    }
    return zlibDecompress(compressed);
}

Expected<CommitObject> GitObjectReader::readCommit(const std::string& hash) const {
    if (!isObjectHash(hash)) {
        return Error{ErrorCode::InvalidArgs, "Not an object hash: " + hash};
    }

    std::error_code ec;
    if (!fs::exists(objectPath(hash), ec)) {
        if (fs::is_directory(dir / "objects" / "pack", ec) && !fs::is_empty(dir / "objects" / "pack", ec)) {
            return Error{ErrorCode::UnsupportedObject,
                         "Object " + hash + " is not a loose object (packed objects are not supported)"};
        }
        return Error{ErrorCode::ObjectNotFound, "Object not found: " + hash};
    }

    std::string fullObject;
    try {
        fullObject = inflateObject(hash);
    } catch (const std::exception& e) {
        return Error{ErrorCode::CorruptObject, std::string(e.what()) + " (" + hash + ")"};
    }

    // Header: "commit <size>\0"
    size_t headerEnd = fullObject.find('\0');
    if (headerEnd == std::string::npos) {
        return Error{ErrorCode::CorruptObject, "Invalid object format: " + hash};
    }
    std::string header = fullObject.substr(0, headerEnd);
    if (!StringUtils::startsWith(header, "commit ")) {
        std::string type = header.substr(0, header.find(' '));
        return Error{ErrorCode::UnsupportedObject, "Object " + hash + " is a " + type + ", not a commit"};
    }
    std::string content = fullObject.substr(headerEnd + 1);
    if (header.substr(7) != std::to_string(content.size())) {
        return Error{ErrorCode::CorruptObject, "Commit size mismatch in object " + hash};
    }

    CommitObject commit;
    commit.hash = StringUtils::toLower(hash);

    size_t blank = content.find("\n\n");
    std::string headerBlock = blank == std::string::npos ? content : content.substr(0, blank);
    commit.message = blank == std::string::npos ? std::string() : content.substr(blank + 2);

    std::istringstream iss(headerBlock);
    std::string line;
    while (std::getline(iss, line)) {
        if (!line.empty() && line[0] == ' ') {
            continue;  // continuation of a multi-line header (gpgsig, mergetag)
        }
        if (StringUtils::startsWith(line, "tree ")) {
            commit.treeHash = StringUtils::trim(line.substr(5));
        } else if (StringUtils::startsWith(line, "parent ")) {
            commit.parentHashes.push_back(StringUtils::trim(line.substr(7)));
        } else if (StringUtils::startsWith(line, "author ")) {
            parseIdentity(line.substr(7), commit);
        }
    }

    if (!isObjectHash(commit.treeHash)) {
        return Error{ErrorCode::CorruptObject, "Commit " + hash + " has no valid tree line"};
    }
    return commit;
}

Expected<CommitObject> GitObjectReader::readHead() const {
    auto head = resolveRef("HEAD");
    if (!head) {
        return head.error();
    }
    return readCommit(head.value());
}

}
