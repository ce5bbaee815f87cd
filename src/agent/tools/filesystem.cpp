#include "agent/tools/filesystem.hpp"

#include <algorithm>
#include <atomic>
#include <cstdint>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include <unistd.h>

#include "output/truncation.hpp"
#include "utils/common.hpp"

namespace rampart::agent::tools {
namespace {

constexpr std::size_t kPreviewLines = 20;
constexpr std::size_t kPreviewChars = 1000;

bool ReadTextFile(const std::filesystem::path& path, std::string& content, std::string& error) {
    std::error_code ec;
    const auto status = std::filesystem::status(path, ec);
    if (!std::filesystem::exists(status)) {
        error = "File not found: " + path.string();
        return false;
    }
    if (std::filesystem::is_directory(status)) {
        error = "Path is a directory: " + path.string();
        return false;
    }
    std::ifstream file(path, std::ios::in | std::ios::binary);
    if (!file.is_open()) {
        error = "Permission denied: " + path.string();
        return false;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    content = buffer.str();
    return true;
}

std::string TypeOf(const std::filesystem::file_status& status) {
    if (std::filesystem::is_symlink(status)) {
        return "symlink";
    }
    if (std::filesystem::is_directory(status)) {
        return "directory";
    }
    if (std::filesystem::is_regular_file(status)) {
        return "file";
    }
    return "other";
}

nlohmann::json PathSchema(const std::string& description) {
    return {{"type", "string"}, {"description", description}};
}

}  // namespace

void WriteFileAtomic(const std::filesystem::path& path, const std::string& content) {
    static std::atomic<unsigned> counter{0};
    auto temp = path;
    temp += ".rampart-" + std::to_string(::getpid()) + "-" + std::to_string(counter++) + ".tmp";
    {
        std::ofstream file(temp, std::ios::out | std::ios::trunc | std::ios::binary);
        if (!file.is_open()) {
            throw std::filesystem::filesystem_error(
                "cannot open for writing", temp, std::make_error_code(std::errc::permission_denied));
        }
        file << content;
        file.close();
        if (!file) {
            std::error_code ec;
            std::filesystem::remove(temp, ec);
            throw std::filesystem::filesystem_error(
                "write failed", temp, std::make_error_code(std::errc::io_error));
        }
    }
    std::error_code ec;
    std::filesystem::rename(temp, path, ec);
    if (ec) {
        std::error_code remove_ec;
        std::filesystem::remove(temp, remove_ec);
        throw std::filesystem::filesystem_error("rename failed", temp, path, ec);
    }
}

nlohmann::json ReadFileTool::InputSchema() const {
    return {
        {"type", "object"},
        {"properties", {
            {"path", PathSchema("The path to the file to read (absolute or relative)")},
            {"offset", {{"type", "number"}, {"description", "Line number to start reading from (1-indexed)"}}},
            {"limit", {{"type", "number"}, {"description", "Maximum number of lines to read"}}},
        }},
        {"required", {"path"}},
    };
}

nlohmann::json ReadFileTool::Execute(const nlohmann::json& input) {
    const auto requested = GetString(input, "path");
    try {
        const auto resolved = boundary_.Resolve(requested);
        std::string content;
        std::string error;
        if (!ReadTextFile(resolved, content, error)) {
            return ErrorResult(error, {{"path", requested}});
        }
        content = utils::SanitizeUtf8(content);

        const auto offset = GetInteger(input, "offset");
        const auto limit = GetInteger(input, "limit");
        if (offset || limit) {
            const auto lines = utils::SplitLines(content);
            const auto first = static_cast<std::size_t>(std::max(1LL, offset.value_or(1)));
            const auto start = std::min(first - 1, lines.size());
            const auto end = (limit && *limit > 0)
                ? start + std::min(static_cast<std::size_t>(*limit), lines.size() - start)
                : lines.size();
            std::ostringstream window;
            for (auto i = start; i < end; ++i) {
                if (i > start) {
                    window << '\n';
                }
                window << (i + 1) << '|' << lines[i];
            }
            const auto text = window.str();
            return {
                {"success", true},
                {"path", resolved.string()},
                {"content", text},
                {"size", text.size()},
                {"totalLines", lines.size()},
            };
        }

        output::TruncateStringOptions options;
        options.output_dir = output_dir_;
        options.metadata = {{"tool", Name()}, {"path", resolved.string()}};
        const auto truncation = output::TruncateString(content, options);
        nlohmann::json result = {
            {"success", true},
            {"path", resolved.string()},
            {"content", truncation.data},
            {"size", truncation.data.size()},
        };
        if (truncation.truncated) {
            result["totalLines"] = truncation.total_count;
            result["linesReturned"] = truncation.returned_count;
        }
        output::AnnotateTruncation(result, truncation);
        return result;
    } catch (const security::PathTraversalError& ex) {
        return ErrorResult(ex.what(), {{"path", requested}});
    }
}

nlohmann::json WriteFileTool::InputSchema() const {
    return {
        {"type", "object"},
        {"properties", {
            {"path", PathSchema("The path to the file to write (absolute or relative)")},
            {"content", {{"type", "string"}, {"description", "The content to write to the file"}}},
        }},
        {"required", {"path", "content"}},
    };
}

nlohmann::json WriteFileTool::Execute(const nlohmann::json& input) {
    const auto requested = GetString(input, "path");
    if (!HasString(input, "content")) {
        return ErrorResult("content is required", {{"path", requested}});
    }
    const auto content = GetString(input, "content");
    try {
        const auto resolved = boundary_.Resolve(requested);
        if (resolved.has_parent_path()) {
            std::filesystem::create_directories(resolved.parent_path());
        }
        WriteFileAtomic(resolved, content);

        const auto lines = utils::SplitLines(content);
        std::vector<std::string> head(lines.begin(),
                                      lines.begin() + static_cast<std::ptrdiff_t>(std::min(lines.size(), kPreviewLines)));
        auto preview = utils::Join(head, "\n");
        if (preview.size() > kPreviewChars) {
            preview = output::Utf8Prefix(preview, kPreviewChars) + "...";
        }
        return {
            {"success", true},
            {"path", resolved.string()},
            {"bytesWritten", content.size()},
            {"lineCount", lines.size()},
            {"preview", preview},
            {"truncated", lines.size() > kPreviewLines || content.size() > kPreviewChars},
        };
    } catch (const security::PathTraversalError& ex) {
        return ErrorResult(ex.what(), {{"path", requested}});
    } catch (const std::filesystem::filesystem_error& ex) {
        return ErrorResult(ex.code().message() + ": " + ex.path1().string(), {{"path", requested}});
    }
}

nlohmann::json EditFileTool::InputSchema() const {
    return {
        {"type", "object"},
        {"properties", {
            {"path", PathSchema("The path to the file to edit (absolute or relative)")},
            {"oldString", {{"type", "string"}, {"description", "The exact text to find and replace"}}},
            {"newString", {{"type", "string"}, {"description", "The replacement text"}}},
            {"replaceAll", {{"type", "boolean"}, {"default", false},
                            {"description", "Replace all occurrences (default: false)"}}},
        }},
        {"required", {"path", "oldString", "newString"}},
    };
}

nlohmann::json EditFileTool::Execute(const nlohmann::json& input) {
    const auto requested = GetString(input, "path");
    const auto old_string = GetString(input, "oldString");
    const auto new_string = GetString(input, "newString");
    const bool replace_all = GetBool(input, "replaceAll");
    try {
        const auto resolved = boundary_.Resolve(requested);
        std::string content;
        std::string error;
        if (!ReadTextFile(resolved, content, error)) {
            return ErrorResult(error, {{"path", requested}});
        }

        const auto occurrences = utils::CountOccurrences(content, old_string);
        if (occurrences == 0) {
            return ErrorResult("oldString not found in file", {{"path", resolved.string()}});
        }
        if (!replace_all && occurrences > 1) {
            return ErrorResult("oldString found " + std::to_string(occurrences) +
                                   " times - must be unique or use replaceAll",
                               {{"path", resolved.string()}, {"occurrences", occurrences}});
        }

        std::string updated;
        updated.reserve(content.size());
        std::size_t pos = 0;
        std::size_t replaced = 0;
        while (true) {
            const auto found = content.find(old_string, pos);
            if (found == std::string::npos || (!replace_all && replaced == 1)) {
                updated.append(content, pos, std::string::npos);
                break;
            }
            updated.append(content, pos, found - pos);
            updated += new_string;
            pos = found + old_string.size();
            ++replaced;
        }
        WriteFileAtomic(resolved, updated);
        return {
            {"success", true},
            {"path", resolved.string()},
            {"replacements", replaced},
        };
    } catch (const security::PathTraversalError& ex) {
        return ErrorResult(ex.what(), {{"path", requested}});
    } catch (const std::filesystem::filesystem_error& ex) {
        return ErrorResult(ex.code().message() + ": " + ex.path1().string(), {{"path", requested}});
    }
}

nlohmann::json DeleteFileTool::InputSchema() const {
    return {
        {"type", "object"},
        {"properties", {
            {"path", PathSchema("The path to the file to delete (absolute or relative)")},
        }},
        {"required", {"path"}},
    };
}

nlohmann::json DeleteFileTool::Execute(const nlohmann::json& input) {
    const auto requested = GetString(input, "path");
    try {
        const auto resolved = boundary_.Resolve(requested);
        const auto status = std::filesystem::symlink_status(resolved);
        if (!std::filesystem::exists(status)) {
            return ErrorResult("File not found: " + resolved.string(), {{"path", requested}});
        }
        if (std::filesystem::is_directory(status)) {
            return ErrorResult("Path is a directory: " + resolved.string(), {{"path", requested}});
        }
        std::filesystem::remove(resolved);
        return {{"success", true}, {"path", resolved.string()}};
    } catch (const security::PathTraversalError& ex) {
        return ErrorResult(ex.what(), {{"path", requested}});
    } catch (const std::filesystem::filesystem_error& ex) {
        return ErrorResult(ex.code().message() + ": " + ex.path1().string(), {{"path", requested}});
    }
}

nlohmann::json ListDirectoryTool::InputSchema() const {
    return {
        {"type", "object"},
        {"properties", {
            {"path", {{"type", "string"}, {"default", "."},
                      {"description", "The path to the directory to list (absolute or relative). "
                                      "Defaults to current directory if empty."}}},
        }},
    };
}

nlohmann::json ListDirectoryTool::Execute(const nlohmann::json& input) {
    auto requested = GetString(input, "path", ".");
    if (requested.empty()) {
        requested = ".";
    }
    try {
        const auto resolved = boundary_.Resolve(requested);
        std::vector<std::pair<std::string, std::string>> entries;
        for (const auto& entry : std::filesystem::directory_iterator(resolved)) {
            const auto name = utils::SanitizeUtf8(entry.path().filename().string());
            if (utils::StartsWith(name, ".")) {
                continue;
            }
            std::error_code ec;
            entries.emplace_back(name, TypeOf(entry.symlink_status(ec)));
        }
        std::sort(entries.begin(), entries.end(), [](const auto& a, const auto& b) {
            const bool a_dir = a.second == "directory";
            const bool b_dir = b.second == "directory";
            if (a_dir != b_dir) {
                return a_dir;
            }
            return a.first < b.first;
        });

        std::vector<nlohmann::json> items;
        items.reserve(entries.size());
        for (const auto& [name, type] : entries) {
            items.push_back({{"name", name}, {"type", type}});
        }
        output::TruncateArrayOptions<nlohmann::json> options;
        options.max_items = output::limits::kDirectoryItems;
        options.output_dir = output_dir_;
        options.metadata = {{"tool", Name()}, {"path", resolved.string()}};
        const auto truncation = output::TruncateArray(items, options);

        nlohmann::json result = {
            {"success", true},
            {"path", resolved.string()},
            {"items", truncation.data},
            {"count", truncation.total_count},
        };
        output::AnnotateTruncation(result, truncation);
        return result;
    } catch (const security::PathTraversalError& ex) {
        return ErrorResult(ex.what(), {{"path", requested}});
    } catch (const std::filesystem::filesystem_error& ex) {
        return ErrorResult(ex.code().message() + ": " + ex.path1().string(), {{"path", requested}});
    }
}

nlohmann::json FileExistsTool::InputSchema() const {
    return {
        {"type", "object"},
        {"properties", {
            {"path", PathSchema("The path to check (absolute or relative)")},
        }},
        {"required", {"path"}},
    };
}

nlohmann::json FileExistsTool::Execute(const nlohmann::json& input) {
    const auto requested = GetString(input, "path");
    try {
        const auto resolved = boundary_.Resolve(requested);
        std::error_code ec;
        const auto status = std::filesystem::status(resolved, ec);
        if (!std::filesystem::exists(status)) {
            if (ec && ec != std::errc::no_such_file_or_directory) {
                return {{"exists", false}, {"path", requested}, {"error", ec.message()}};
            }
            return {{"exists", false}, {"path", requested}};
        }
        const bool is_directory = std::filesystem::is_directory(status);
        std::uintmax_t size = 0;
        if (std::filesystem::is_regular_file(status)) {
            size = std::filesystem::file_size(resolved, ec);
            if (ec) {
                size = 0;
            }
        }
        return {
            {"exists", true},
            {"path", resolved.string()},
            {"isDirectory", is_directory},
            {"type", is_directory ? "directory" : (std::filesystem::is_regular_file(status) ? "file" : "other")},
            {"size", size},
        };
    } catch (const security::PathTraversalError& ex) {
        return {{"exists", false}, {"path", requested}, {"error", ex.what()}};
    }
}

}  // namespace rampart::agent::tools
