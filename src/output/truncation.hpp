#pragma once

#include <cstddef>
#include <filesystem>
#include <functional>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"

namespace rampart::output {

namespace limits {
constexpr std::size_t kFileContentChars = 30000;
constexpr std::size_t kFileContentLines = 500;
constexpr std::size_t kGrepMatches = 200;
constexpr std::size_t kGlobFiles = 500;
constexpr std::size_t kDirectoryItems = 500;
constexpr std::size_t kCommandStdoutChars = 50000;
constexpr std::size_t kCommandStderrChars = 20000;
constexpr std::size_t kWebContentChars = 20000;
constexpr std::size_t kReadToolOutputLines = 500;
}  // namespace limits

template <typename T>
struct TruncationResult {
    T data;
    bool truncated = false;
    std::size_t total_count = 0;
    std::size_t returned_count = 0;
    // Set iff truncated and an output directory was configured.
    std::optional<std::string> saved_path;
    std::optional<std::string> message;
};

struct TruncateStringOptions {
    std::size_t max_chars = limits::kFileContentChars;
    std::size_t max_lines = limits::kFileContentLines;
    std::optional<std::filesystem::path> output_dir;
    // Generated when empty.
    std::string output_id;
    nlohmann::json metadata = nlohmann::json::object();
};

template <typename T>
struct TruncateArrayOptions {
    std::size_t max_items = limits::kGrepMatches;
    std::optional<std::filesystem::path> output_dir;
    std::string output_id;
    // Defaults to the item's JSON serialization.
    std::function<std::string(const T&)> item_to_string;
    nlohmann::json metadata = nlohmann::json::object();
};

struct SavedOutputPage {
    std::string content;
    std::size_t total_lines = 0;
    bool has_more = false;
};

// "tool_" + base36 milliseconds + six random base36 characters.
std::string GenerateOutputId();

// Writes <output_dir>/<output_id>.txt, preceded by "---" delimited key: value
// lines when metadata is non-empty. Throws std::runtime_error when the file
// cannot be written.
std::string SaveToolOutput(const std::filesystem::path& output_dir,
                           const std::string& output_id,
                           const std::string& content,
                           const nlohmann::json& metadata = nlohmann::json::object());

// Line-range pagination over a saved file. `offset` is 0-indexed; an absent
// limit reads to the end. Throws std::runtime_error when the file is missing.
SavedOutputPage ReadSavedToolOutput(const std::filesystem::path& path,
                                    std::size_t offset = 0,
                                    std::optional<std::size_t> limit = std::nullopt);

TruncationResult<std::string> TruncateString(const std::string& content,
                                             const TruncateStringOptions& options = {});

// Cuts at most `max_bytes` without splitting a UTF-8 sequence.
std::string Utf8Prefix(const std::string& value, std::size_t max_bytes);

template <typename T>
TruncationResult<std::vector<T>> TruncateArray(const std::vector<T>& items,
                                               const TruncateArrayOptions<T>& options = {}) {
    TruncationResult<std::vector<T>> result;
    result.total_count = items.size();
    if (items.size() <= options.max_items) {
        result.data = items;
        result.returned_count = items.size();
        return result;
    }

    result.data.assign(items.begin(), items.begin() + static_cast<std::ptrdiff_t>(options.max_items));
    result.truncated = true;
    result.returned_count = result.data.size();

    std::ostringstream summary;
    summary << "(Results truncated: showing " << result.returned_count << " of "
            << result.total_count << " items. ";
    if (options.output_dir.has_value()) {
        std::string full;
        for (std::size_t i = 0; i < items.size(); ++i) {
            if (i > 0) {
                full.push_back('\n');
            }
            full += options.item_to_string ? options.item_to_string(items[i])
                                           : nlohmann::json(items[i]).dump();
        }
        nlohmann::json metadata = options.metadata.is_object() ? options.metadata
                                                               : nlohmann::json::object();
        metadata["totalItems"] = result.total_count;
        metadata["format"] = "array";
        const auto id = options.output_id.empty() ? GenerateOutputId() : options.output_id;
        result.saved_path = SaveToolOutput(*options.output_dir, id, full, metadata);
        summary << "Full output saved to: " << *result.saved_path
                << ". Use readToolOutput tool with offset/limit to explore.)";
    } else {
        summary << "Consider using a more specific pattern.)";
    }
    result.message = summary.str();
    return result;
}

// Adds truncated/savedPath/truncationMessage fields to a tool result.
template <typename T>
void AnnotateTruncation(nlohmann::json& target, const TruncationResult<T>& truncation) {
    target["truncated"] = truncation.truncated;
    if (!truncation.truncated) {
        return;
    }
    if (truncation.message.has_value()) {
        target["truncationMessage"] = *truncation.message;
    }
    if (truncation.saved_path.has_value()) {
        target["savedPath"] = *truncation.saved_path;
    }
}

}  // namespace rampart::output
