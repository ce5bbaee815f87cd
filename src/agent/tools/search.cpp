#include "agent/tools/search.hpp"

#include <algorithm>
#include <limits>

#include "output/truncation.hpp"
#include "utils/common.hpp"

namespace rampart::agent::tools {

GrepTool::GrepTool(security::SecurityBoundary boundary,
                   SearchToolOptions options,
                   std::shared_ptr<const SearchBackend> backend)
    : boundary_(std::move(boundary))
    , options_(std::move(options))
    , backend_(backend ? std::move(backend) : SearchBackend::Detect()) {}

nlohmann::json GrepTool::InputSchema() const {
    return {
        {"type", "object"},
        {"properties", {
            {"pattern", {{"type", "string"}, {"description", "Regex pattern to search for"}}},
            {"path", {{"type", "string"},
                      {"description", "File or directory to search (default: current directory)"}}},
            {"fileType", {{"type", "string"}, {"description", "File type filter (e.g., \"js\", \"py\", \"tsx\")"}}},
            {"glob", {{"type", "string"}, {"description", "Glob pattern filter (e.g., \"*.config.ts\")"}}},
            {"caseInsensitive", {{"type", "boolean"}, {"default", false}, {"description", "Case-insensitive search"}}},
            {"context", {{"type", "number"}, {"description", "Lines of context before and after each match"}}},
            {"maxResults", {{"type", "number"}, {"description", "Maximum number of results to return"}}},
        }},
        {"required", {"pattern"}},
    };
}

nlohmann::json GrepTool::Execute(const nlohmann::json& input) {
    if (!HasString(input, "pattern")) {
        return ErrorResult("pattern is required", {{"matches", nlohmann::json::array()}});
    }
    try {
        GrepQuery query;
        query.pattern = GetString(input, "pattern");
        query.path = HasString(input, "path") ? boundary_.Resolve(GetString(input, "path"))
                                              : boundary_.DefaultDirectory();
        query.file_type = GetString(input, "fileType");
        query.glob = GetString(input, "glob");
        query.case_insensitive = GetBool(input, "caseInsensitive");
        query.context = static_cast<int>(std::clamp<long long>(
            GetInteger(input, "context").value_or(0), 0, std::numeric_limits<int>::max()));

        std::optional<std::size_t> requested;
        if (const auto max = GetInteger(input, "maxResults"); max && *max > 0) {
            requested = static_cast<std::size_t>(*max);
        }
        query.limit = std::max(requested.value_or(options_.max_results), output::limits::kGrepMatches) *
                      kSearchOverscan;

        const auto matches = backend_->Grep(query);

        output::TruncateArrayOptions<GrepMatch> truncate;
        truncate.max_items = requested.value_or(std::min(options_.max_results, output::limits::kGrepMatches));
        truncate.output_dir = options_.output_dir;
        truncate.item_to_string = [](const GrepMatch& match) {
            return match.file + ":" + std::to_string(match.line) + ": " + match.content;
        };
        truncate.metadata = {{"tool", Name()}, {"pattern", query.pattern}, {"path", query.path.string()}};
        const auto truncation = output::TruncateArray(matches, truncate);

        nlohmann::json result = {
            {"success", true},
            {"matches", truncation.data},
            {"totalMatches", matches.size()},
            {"returnedMatches", truncation.returned_count},
        };
        output::AnnotateTruncation(result, truncation);
        return result;
    } catch (const security::PathTraversalError& ex) {
        return ErrorResult(ex.what(), {{"matches", nlohmann::json::array()}});
    } catch (const SearchError& ex) {
        return ErrorResult(ex.what(), {{"matches", nlohmann::json::array()}});
    }
}

GlobFileSearchTool::GlobFileSearchTool(security::SecurityBoundary boundary,
                                       SearchToolOptions options,
                                       std::shared_ptr<const SearchBackend> backend)
    : boundary_(std::move(boundary))
    , options_(std::move(options))
    , backend_(backend ? std::move(backend) : SearchBackend::Detect()) {}

nlohmann::json GlobFileSearchTool::InputSchema() const {
    return {
        {"type", "object"},
        {"properties", {
            {"pattern", {{"type", "string"},
                         {"description", "Glob pattern (e.g., \"*.tsx\", \"**/test/*.spec.ts\")"}}},
            {"directory", {{"type", "string"},
                           {"description", "Directory to search in (default: current directory)"}}},
        }},
        {"required", {"pattern"}},
    };
}

nlohmann::json GlobFileSearchTool::Execute(const nlohmann::json& input) {
    if (!HasString(input, "pattern")) {
        return ErrorResult("pattern is required", {{"files", nlohmann::json::array()}});
    }
    try {
        const auto pattern = GetString(input, "pattern");
        const auto directory = HasString(input, "directory") ? boundary_.Resolve(GetString(input, "directory"))
                                                             : boundary_.DefaultDirectory();
        auto files = backend_->FindFiles(pattern, directory, output::limits::kGlobFiles * kSearchOverscan);
        SortByMtime(files);

        std::vector<std::string> names;
        names.reserve(files.size());
        for (const auto& file : files) {
            names.push_back(utils::SanitizeUtf8(file.string()));
        }
        output::TruncateArrayOptions<std::string> truncate;
        truncate.max_items = std::min(options_.max_results, output::limits::kGlobFiles);
        truncate.output_dir = options_.output_dir;
        truncate.item_to_string = [](const std::string& file) { return file; };
        truncate.metadata = {{"tool", Name()}, {"pattern", pattern}, {"directory", directory.string()}};
        const auto truncation = output::TruncateArray(names, truncate);

        nlohmann::json result = {
            {"success", true},
            {"files", truncation.data},
            {"count", truncation.returned_count},
            {"totalCount", truncation.total_count},
        };
        output::AnnotateTruncation(result, truncation);
        return result;
    } catch (const security::PathTraversalError& ex) {
        return ErrorResult(ex.what(), {{"files", nlohmann::json::array()}});
    } catch (const SearchError& ex) {
        return ErrorResult(ex.what(), {{"files", nlohmann::json::array()}});
    }
}

}  // namespace rampart::agent::tools
