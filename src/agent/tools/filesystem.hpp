#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include "agent/tools/tool.hpp"
#include "security/path_boundary.hpp"

namespace rampart::agent::tools {

// Shared state of the file tools: the path boundary every argument resolves
// through, and the overflow directory for oversized results.
class FilesystemTool : public Tool {
public:
    FilesystemTool(security::SecurityBoundary boundary,
                   std::optional<std::filesystem::path> output_dir)
        : boundary_(std::move(boundary))
        , output_dir_(std::move(output_dir)) {}

protected:
    security::SecurityBoundary boundary_;
    std::optional<std::filesystem::path> output_dir_;
};

class ReadFileTool : public FilesystemTool {
public:
    using FilesystemTool::FilesystemTool;
    std::string Name() const override { return "readFile"; }
    std::string Description() const override {
        return "Read the contents of a file at the specified path. Returns the file content as text. "
               "Supports optional line offset and limit.";
    }
    nlohmann::json InputSchema() const override;
    nlohmann::json Execute(const nlohmann::json& input) override;
};

class WriteFileTool : public FilesystemTool {
public:
    using FilesystemTool::FilesystemTool;
    std::string Name() const override { return "writeFile"; }
    std::string Description() const override {
        return "Write content to a file at the specified path. Creates the file if it does not exist, "
               "or overwrites it if it does.";
    }
    nlohmann::json InputSchema() const override;
    nlohmann::json Execute(const nlohmann::json& input) override;
};

class EditFileTool : public FilesystemTool {
public:
    using FilesystemTool::FilesystemTool;
    std::string Name() const override { return "editFile"; }
    std::string Description() const override {
        return "Perform surgical string replacement in a file. The oldString must be unique unless "
               "replaceAll is true.";
    }
    nlohmann::json InputSchema() const override;
    nlohmann::json Execute(const nlohmann::json& input) override;
};

class DeleteFileTool : public FilesystemTool {
public:
    using FilesystemTool::FilesystemTool;
    std::string Name() const override { return "deleteFile"; }
    std::string Description() const override { return "Delete a file at the specified path."; }
    nlohmann::json InputSchema() const override;
    nlohmann::json Execute(const nlohmann::json& input) override;
};

class ListDirectoryTool : public FilesystemTool {
public:
    using FilesystemTool::FilesystemTool;
    std::string Name() const override { return "listDirectory"; }
    std::string Description() const override {
        return "List the contents of a directory. Returns file and directory names with their types.";
    }
    nlohmann::json InputSchema() const override;
    nlohmann::json Execute(const nlohmann::json& input) override;
};

class FileExistsTool : public FilesystemTool {
public:
    using FilesystemTool::FilesystemTool;
    std::string Name() const override { return "fileExists"; }
    std::string Description() const override {
        return "Check if a file or directory exists at the specified path.";
    }
    nlohmann::json InputSchema() const override;
    nlohmann::json Execute(const nlohmann::json& input) override;
};

// Writes through a temporary sibling renamed over the target.
void WriteFileAtomic(const std::filesystem::path& path, const std::string& content);

}  // namespace rampart::agent::tools
