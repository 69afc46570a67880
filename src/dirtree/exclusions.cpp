#include "dirtree/exclusions.hpp"

#include "dirtree/logger.hpp"

#include <nlohmann/json.hpp>

#include <format>
#include <fstream>
#include <optional>

namespace dirtree {
namespace {

constexpr std::string_view kDirectoriesKey = "exclude_dirs";
constexpr std::string_view kFilesKey = "exclude_files";

void warn_unusable(const std::filesystem::path& path, std::string_view reason) {
    Logger::instance().warn("'{}' not found or has an invalid format ({})", path.string(), reason);
}

// Returns std::nullopt when the key holds something other than an array of strings.
std::optional<std::set<std::string>> read_names(const nlohmann::json& document, std::string_view key) {
    std::set<std::string> names;
    auto it = document.find(std::string{key});
    if (it == document.end()) {
        return names;
    }
    if (!it->is_array()) {
        return std::nullopt;
    }
    for (const auto& item : *it) {
        if (!item.is_string()) {
            return std::nullopt;
        }
        names.insert(item.get<std::string>());
    }
    return names;
}

} // namespace

bool ExclusionConfig::excludes_directory(std::string_view name) const {
    return excluded_directory_names.find(std::string{name}) != excluded_directory_names.end();
}

bool ExclusionConfig::excludes_file(std::string_view name) const {
    return excluded_file_names.find(std::string{name}) != excluded_file_names.end();
}

bool ExclusionConfig::empty() const noexcept {
    return excluded_directory_names.empty() && excluded_file_names.empty();
}

ExclusionConfig load_exclusions(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) {
        warn_unusable(path, "cannot open file");
        return {};
    }

    nlohmann::json document;
    try {
        in >> document;
    } catch (const nlohmann::json::exception& e) {
        warn_unusable(path, e.what());
        return {};
    }

    if (!document.is_object()) {
        warn_unusable(path, "expected a JSON object");
        return {};
    }

    auto directories = read_names(document, kDirectoriesKey);
    if (!directories) {
        warn_unusable(path, std::format("\"{}\" must be an array of strings", kDirectoriesKey));
        return {};
    }
    auto files = read_names(document, kFilesKey);
    if (!files) {
        warn_unusable(path, std::format("\"{}\" must be an array of strings", kFilesKey));
        return {};
    }

    ExclusionConfig config;
    config.excluded_directory_names = std::move(*directories);
    config.excluded_file_names = std::move(*files);
    Logger::instance().debug("loaded {} directory and {} file exclusions from {}",
        config.excluded_directory_names.size(), config.excluded_file_names.size(), path.string());
    return config;
}

} // namespace dirtree
