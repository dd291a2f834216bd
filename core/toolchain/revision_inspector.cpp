#include "toolchain/revision_inspector.hpp"
#include "common/errors.hpp"

#include <regex>
#include <sstream>
#include <vector>

namespace adabench {

namespace {

std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    size_t begin = s.find_first_not_of(ws);
    if (begin == std::string::npos) return "";
    size_t end = s.find_last_not_of(ws);
    return s.substr(begin, end - begin + 1);
}

} // namespace

GitRevisionInspector::GitRevisionInspector(CommandRunner& runner)
    : runner_(runner),
      cache_([this](const std::string& path) { return query(path); }) {}

RevisionInfo GitRevisionInspector::inspect(const std::string& source_path) {
    return cache_.get(source_path);
}

RevisionInfo GitRevisionInspector::query(const std::string& source_path) {
    Command head;
    head.program = "git";
    head.args = {"rev-parse", "HEAD"};
    head.cwd = source_path;

    Command tags;
    tags.program = "git";
    tags.args = {"tag", "--points-at", "HEAD"};
    tags.cwd = source_path;

    RevisionInfo info;
    info.commit_hash = trim(runner_.run(head).stdout_text);
    info.version_name = versionFromTags(runner_.run(tags).stdout_text);
    return info;
}

std::optional<std::string> GitRevisionInspector::versionFromTags(const std::string& tag_output) {
    static const std::regex version_tag("v[0-9].*");
    std::vector<std::string> versions;
    std::istringstream lines(tag_output);
    std::string line;
    while (std::getline(lines, line)) {
        line = trim(line);
        if (std::regex_match(line, version_tag)) {
            versions.push_back(line.substr(1));
        }
    }
    if (versions.empty()) return std::nullopt;
    if (versions.size() > 1) {
        throw ConfigurationError("Found more than one version tag at HEAD: v" + versions[0] + ", v" + versions[1]);
    }
    return versions.front();
}

} // namespace adabench
