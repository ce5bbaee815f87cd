#include "output/truncation.hpp"

#include <algorithm>
#include <array>
#include <chrono>
#include <fstream>
#include <random>
#include <sstream>
#include <stdexcept>
#include <system_error>

#include <openssl/rand.h>

#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace rampart::output {
namespace {

constexpr const char* kBase36 = "0123456789abcdefghijklmnopqrstuvwxyz";

std::string ToBase36(unsigned long long value) {
    if (value == 0) {
        return "0";
    }
    std::string out;
    while (value > 0) {
        out.push_back(kBase36[value % 36]);
        value /= 36;
    }
    return std::string(out.rbegin(), out.rend());
}

std::string RandomBase36(std::size_t length) {
    std::array<unsigned char, 16> bytes{};
    if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
        // RAND_bytes only fails when the PRNG is unseeded.
        std::random_device device;
        for (auto& byte : bytes) {
            byte = static_cast<unsigned char>(device());
        }
    }
    std::string out;
    for (std::size_t i = 0; i < length; ++i) {
        out.push_back(kBase36[bytes[i % bytes.size()] % 36]);
    }
    return out;
}

}  // namespace

std::string GenerateOutputId() {
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    return "tool_" + ToBase36(static_cast<unsigned long long>(millis)) + RandomBase36(6);
}

std::string SaveToolOutput(const std::filesystem::path& output_dir,
                           const std::string& output_id,
                           const std::string& content,
                           const nlohmann::json& metadata) {
    std::error_code ec;
    std::filesystem::create_directories(output_dir, ec);
    if (ec) {
        throw std::runtime_error("Failed to create tool output directory " +
                                 output_dir.string() + ": " + ec.message());
    }
    const auto path = output_dir / (output_id + ".txt");
    std::ofstream file(path, std::ios::out | std::ios::trunc | std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to write tool output: " + path.string());
    }
    if (metadata.is_object() && !metadata.empty()) {
        file << "---\n";
        for (const auto& item : metadata.items()) {
            file << item.key() << ": " << item.value().dump() << "\n";
        }
        file << "---\n\n";
    }
    file << content;
    file.close();
    if (!file) {
        throw std::runtime_error("Failed to write tool output: " + path.string());
    }
    utils::Log(utils::LogLevel::kDebug, "output", "saved overflow",
               {{"path", path.string()}, {"bytes", std::to_string(content.size())}});
    return path.string();
}

SavedOutputPage ReadSavedToolOutput(const std::filesystem::path& path,
                                    std::size_t offset,
                                    std::optional<std::size_t> limit) {
    std::ifstream file(path, std::ios::in | std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Tool output file not found: " + path.string());
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    const auto lines = utils::SplitLines(buffer.str());

    SavedOutputPage page;
    page.total_lines = lines.size();
    const auto start = std::min(offset, lines.size());
    const auto end = (limit.has_value() && *limit > 0)
        ? start + std::min(*limit, lines.size() - start)
        : lines.size();
    std::vector<std::string> selected;
    if (start < end) {
        selected.assign(lines.begin() + static_cast<std::ptrdiff_t>(start),
                        lines.begin() + static_cast<std::ptrdiff_t>(end));
    }
    page.content = utils::Join(selected, "\n");
    page.has_more = end < lines.size();
    return page;
}

std::string Utf8Prefix(const std::string& value, std::size_t max_bytes) {
    if (value.size() <= max_bytes) {
        return value;
    }
    std::size_t cut = max_bytes;
    // Back up over continuation bytes (10xxxxxx) to a sequence boundary.
    while (cut > 0 && (static_cast<unsigned char>(value[cut]) & 0xC0) == 0x80) {
        --cut;
    }
    return value.substr(0, cut);
}

TruncationResult<std::string> TruncateString(const std::string& content,
                                             const TruncateStringOptions& options) {
    const auto lines = utils::SplitLines(content);
    TruncationResult<std::string> result;
    result.total_count = lines.size();

    const bool over_chars = content.size() > options.max_chars;
    const bool over_lines = lines.size() > options.max_lines;
    if (!over_chars && !over_lines) {
        result.data = content;
        result.returned_count = lines.size();
        return result;
    }

    std::string bounded;
    if (over_lines) {
        std::vector<std::string> head(lines.begin(),
                                      lines.begin() + static_cast<std::ptrdiff_t>(options.max_lines));
        bounded = utils::Join(head, "\n");
    } else {
        bounded = content;
    }
    bounded = Utf8Prefix(bounded, options.max_chars);

    result.data = std::move(bounded);
    result.truncated = true;
    result.returned_count = result.data.empty() ? 0 : utils::SplitLines(result.data).size();

    std::ostringstream summary;
    summary << "(Results truncated: showing " << result.returned_count << " of "
            << result.total_count << " lines. ";
    if (options.output_dir.has_value()) {
        const auto id = options.output_id.empty() ? GenerateOutputId() : options.output_id;
        result.saved_path = SaveToolOutput(*options.output_dir, id, content, options.metadata);
        summary << "Full output saved to: " << *result.saved_path
                << ". Use readToolOutput tool with offset/limit to explore.)";
    } else {
        summary << "Consider using offset/limit parameters or a more specific query.)";
    }
    result.message = summary.str();
    return result;
}

}  // namespace rampart::output
