#include "cli/commands/LastCommand.hpp"

#include <filesystem>
#include <iostream>

#include "cli/VerdictReporter.hpp"
#include "core/GitObjectReader.hpp"
#include "util/Logger.hpp"

namespace commitcheck {

Expected<void> LastCommand::execute(const AppContext& ctx, const std::vector<std::string>& args) {
    std::filesystem::path repoPath = std::filesystem::current_path();
    for (size_t i = 0; i < args.size(); ++i) {
        if (args[i] == "--repo" && i + 1 < args.size()) {
            repoPath = args[++i];
        } else {
            return Error{ErrorCode::InvalidArgs, "unexpected argument '" + args[i] + "'"};
        }
    }

    auto gitDir = GitObjectReader::discoverGitDir(repoPath);
    if (!gitDir) return gitDir.error();
    Logger::instance().debug("Using git directory " + gitDir.value().string());

    GitObjectReader reader(gitDir.value());
    auto commit = reader.readHead();
    if (!commit) return commit.error();

    const CommitObject& c = commit.value();
    std::cout << "commit " << c.shortHash();
    if (!c.authorName.empty()) {
        std::cout << " (" << c.authorName << ")";
    }
    std::cout << "\n";

    return VerdictReporter::validateAndReport(ctx.config, c.message, "commit " + c.shortHash(), true);
}

}
