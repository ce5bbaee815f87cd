#include "agent/tools/search_backend.hpp"

#include <algorithm>
#include <fstream>
#include <future>
#include <regex>
#include <sstream>

#include <boost/asio/io_context.hpp>

#include "utils/common.hpp"
#include "utils/glob.hpp"
#include "utils/logging.hpp"
#include "utils/process.hpp"

namespace rampart::agent::tools {
namespace bp = utils::bp;
namespace {

constexpr std::size_t kBinarySniffBytes = 8192;

struct UtilityOutput {
    int exit_code = 0;
    std::string out;
    std::string err;
};

UtilityOutput RunUtility(const std::filesystem::path& exe, const std::vector<std::string>& args) {
    try {
        boost::asio::io_context ioc;
        std::future<std::string> out;
        std::future<std::string> err;
        bp::child child(bp::exe = exe.string(),
                        bp::args = args,
                        bp::std_in.close(),
                        bp::std_out > out,
                        bp::std_err > err,
                        ioc);
        ioc.run();
        child.wait();
        return UtilityOutput{child.exit_code(), out.get(), err.get()};
    } catch (const bp::process_error& ex) {
        throw SearchError("Failed to run " + exe.filename().string() + ": " + ex.what());
    }
}

bool IsSkippedDirectory(const std::string& name) {
    return name == "node_modules" || utils::StartsWith(name, ".git");
}

// Calls visit(path) for each regular file until it returns false.
template <typename Visitor>
void WalkFiles(const std::filesystem::path& root, Visitor&& visit) {
    std::error_code ec;
    const auto root_status = std::filesystem::status(root, ec);
    if (std::filesystem::is_regular_file(root_status)) {
        visit(root);
        return;
    }
    if (!std::filesystem::is_directory(root_status)) {
        throw SearchError("Path not found: " + root.string());
    }
    auto it = std::filesystem::recursive_directory_iterator(
        root, std::filesystem::directory_options::skip_permission_denied, ec);
    for (; !ec && it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
        std::error_code status_ec;
        const auto status = it->symlink_status(status_ec);
        if (std::filesystem::is_directory(status)) {
            if (IsSkippedDirectory(it->path().filename().string())) {
                it.disable_recursion_pending();
            }
            continue;
        }
        if (!std::filesystem::is_regular_file(status)) {
            continue;
        }
        if (!visit(it->path())) {
            return;
        }
    }
}

bool LooksBinary(const std::string& content) {
    const auto sniff = std::min(content.size(), kBinarySniffBytes);
    return content.find('\0', 0) < sniff;
}

std::string RelativeGeneric(const std::filesystem::path& file, const std::filesystem::path& root) {
    const auto rel = file.lexically_relative(root);
    return rel.empty() ? file.filename().generic_string() : rel.generic_string();
}

bool MatchesGlob(const std::regex& matcher,
                 const std::filesystem::path& file,
                 const std::filesystem::path& root) {
    return std::regex_match(RelativeGeneric(file, root), matcher) ||
           std::regex_match(file.filename().string(), matcher);
}

std::optional<std::filesystem::path> FindExecutable(const char* name) {
    const auto found = bp::search_path(name);
    if (found.empty()) {
        return std::nullopt;
    }
    return std::filesystem::path(found.string());
}

}  // namespace

void to_json(nlohmann::json& j, const GrepMatch& match) {
    j = nlohmann::json{{"file", utils::SanitizeUtf8(match.file)},
                       {"line", match.line},
                       {"content", utils::SanitizeUtf8(match.content)}};
}

std::vector<GrepMatch> PortableSearchBackend::Grep(const GrepQuery& query) const {
    auto flags = std::regex::ECMAScript;
    if (query.case_insensitive) {
        flags |= std::regex::icase;
    }
    std::regex matcher;
    try {
        matcher = std::regex(query.pattern, flags);
    } catch (const std::regex_error& ex) {
        throw SearchError("Invalid regex pattern: " + std::string(ex.what()));
    }
    std::optional<std::regex> glob_filter;
    if (!query.glob.empty()) {
        try {
            glob_filter = utils::GlobToRegex(query.glob, true);
        } catch (const std::regex_error& ex) {
            throw SearchError("Invalid glob pattern: " + std::string(ex.what()));
        }
    }
    const auto extension = query.file_type.empty() ? std::string() : "." + utils::ToLower(query.file_type);

    std::vector<GrepMatch> matches;
    WalkFiles(query.path, [&](const std::filesystem::path& file) {
        if (query.limit > 0 && matches.size() >= query.limit) {
            return false;
        }
        if (!extension.empty() && !utils::EndsWith(utils::ToLower(file.filename().string()), extension)) {
            return true;
        }
        if (glob_filter && !MatchesGlob(*glob_filter, file, query.path)) {
            return true;
        }
        std::ifstream input(file, std::ios::in | std::ios::binary);
        if (!input.is_open()) {
            return true;
        }
        std::stringstream buffer;
        buffer << input.rdbuf();
        const auto contents = buffer.str();
        if (LooksBinary(contents)) {
            return true;
        }
        const auto lines = utils::SplitLines(contents);
        for (std::size_t i = 0; i < lines.size(); ++i) {
            auto line = lines[i];
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            if (std::regex_search(line, matcher)) {
                matches.push_back(GrepMatch{file.string(), i + 1, utils::Trim(line)});
                if (query.limit > 0 && matches.size() >= query.limit) {
                    return false;
                }
            }
        }
        return true;
    });
    return matches;
}

std::vector<std::filesystem::path> PortableSearchBackend::FindFiles(const std::string& glob,
                                                                    const std::filesystem::path& directory,
                                                                    std::size_t limit) const {
    std::regex matcher;
    try {
        matcher = utils::GlobToRegex(glob, true);
    } catch (const std::regex_error& ex) {
        throw SearchError("Invalid glob pattern: " + std::string(ex.what()));
    }
    std::vector<std::filesystem::path> files;
    WalkFiles(directory, [&](const std::filesystem::path& file) {
        if (limit > 0 && files.size() >= limit) {
            return false;
        }
        if (MatchesGlob(matcher, file, directory)) {
            files.push_back(file);
        }
        return true;
    });
    return files;
}

FastSearchBackend::FastSearchBackend(std::optional<std::filesystem::path> rg,
                                     std::optional<std::filesystem::path> fd)
    : rg_(std::move(rg))
    , fd_(std::move(fd)) {}

std::string FastSearchBackend::Name() const {
    std::vector<std::string> parts;
    parts.push_back(rg_ ? "rg" : "portable-grep");
    parts.push_back(fd_ ? fd_->filename().string() : "portable-find");
    return utils::Join(parts, "+");
}

std::vector<GrepMatch> FastSearchBackend::Grep(const GrepQuery& query) const {
    if (!rg_) {
        return portable_.Grep(query);
    }
    std::vector<std::string> args = {"--json"};
    if (query.limit > 0) {
        args.insert(args.end(), {"--max-count", std::to_string(query.limit)});
    }
    if (query.case_insensitive) {
        args.push_back("-i");
    }
    if (query.context > 0) {
        args.insert(args.end(), {"-C", std::to_string(query.context)});
    }
    if (!query.file_type.empty()) {
        args.insert(args.end(), {"-t", query.file_type});
    }
    if (!query.glob.empty()) {
        args.insert(args.end(), {"-g", query.glob});
    }
    args.insert(args.end(), {"--", query.pattern, query.path.string()});

    const auto output = RunUtility(*rg_, args);
    std::vector<GrepMatch> matches;
    std::istringstream stream(output.out);
    std::string line;
    while (std::getline(stream, line)) {
        if (query.limit > 0 && matches.size() >= query.limit) {
            break;
        }
        const auto event = nlohmann::json::parse(line, nullptr, false);
        if (event.is_discarded() || !event.is_object() || event.value("type", "") != "match" ||
            !event.contains("data")) {
            continue;
        }
        const auto& data = event["data"];
        if (!data.contains("path") || !data["path"].contains("text") ||
            !data.contains("lines") || !data["lines"].contains("text")) {
            continue;
        }
        matches.push_back(GrepMatch{
            data["path"]["text"].get<std::string>(),
            data.value("line_number", std::size_t{0}),
            utils::Trim(data["lines"]["text"].get<std::string>()),
        });
    }
    // rg exits 1 for "no matches" and 2 for errors, possibly after partial output.
    if (output.exit_code >= 2 && matches.empty()) {
        throw SearchError(utils::Trim(output.err).empty() ? "rg failed" : utils::Trim(output.err));
    }
    if (output.exit_code >= 2) {
        utils::LogWarn("search", "rg reported errors: " + utils::Trim(output.err));
    }
    return matches;
}

std::vector<std::filesystem::path> FastSearchBackend::FindFiles(const std::string& glob,
                                                                const std::filesystem::path& directory,
                                                                std::size_t limit) const {
    if (!fd_) {
        return portable_.FindFiles(glob, directory, limit);
    }
    std::error_code ec;
    if (!std::filesystem::is_directory(directory, ec)) {
        throw SearchError("Path not found: " + directory.string());
    }
    std::vector<std::string> args = {"--type", "f", "--glob"};
    auto pattern = glob;
    if (glob.find('/') != std::string::npos) {
        args.push_back("--full-path");
        if (!utils::StartsWith(pattern, "/") && !utils::StartsWith(pattern, "**")) {
            pattern = "**/" + pattern;
        }
    }
    if (limit > 0) {
        args.insert(args.end(), {"--max-results", std::to_string(limit)});
    }
    args.insert(args.end(), {"--", pattern, directory.string()});

    const auto output = RunUtility(*fd_, args);
    if (output.exit_code != 0) {
        const auto message = utils::Trim(output.err);
        throw SearchError(message.empty() ? "fd failed" : message);
    }
    std::vector<std::filesystem::path> files;
    std::istringstream stream(output.out);
    std::string line;
    while (std::getline(stream, line)) {
        if (!line.empty()) {
            files.emplace_back(line);
        }
    }
    return files;
}

std::shared_ptr<const SearchBackend> SearchBackend::Detect() {
    static const std::shared_ptr<const SearchBackend> backend = [] {
        auto rg = FindExecutable("rg");
        auto fd = FindExecutable("fd");
        if (!fd) {
            fd = FindExecutable("fdfind");
        }
        std::shared_ptr<const SearchBackend> selected;
        if (rg || fd) {
            selected = std::make_shared<FastSearchBackend>(rg, fd);
        } else {
            selected = std::make_shared<PortableSearchBackend>();
        }
        utils::Log(utils::LogLevel::kInfo, "search", "backend selected", {{"backend", selected->Name()}});
        return selected;
    }();
    return backend;
}

void SortByMtime(std::vector<std::filesystem::path>& files) {
    std::vector<std::pair<std::filesystem::file_time_type, std::filesystem::path>> stamped;
    stamped.reserve(files.size());
    for (auto& file : files) {
        std::error_code ec;
        auto mtime = std::filesystem::last_write_time(file, ec);
        if (ec) {
            mtime = std::filesystem::file_time_type::min();
        }
        stamped.emplace_back(mtime, std::move(file));
    }
    std::sort(stamped.begin(), stamped.end(), [](const auto& a, const auto& b) {
        if (a.first != b.first) {
            return a.first > b.first;
        }
        return a.second < b.second;
    });
    files.clear();
    for (auto& [mtime, file] : stamped) {
        files.push_back(std::move(file));
    }
}

}  // namespace rampart::agent::tools
