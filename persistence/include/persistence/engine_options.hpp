#pragma once

#include <log/level.hpp>
#include <shared_data/file_operations/error_action.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstddef>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>

namespace Persistence
{
    /**
     * @brief Tunables of the file operation engine. Unset fields fall back to the next layer,
     * and finally to EngineOptions::defaults().
     */
    struct EngineOptions
    {
        std::optional<std::size_t> chunkSize{std::nullopt};
        std::optional<std::size_t> maxUndoHistory{std::nullopt};
        // Wait for a user decision on errors instead of answering defaultErrorAction right away.
        std::optional<bool> interactiveErrors{std::nullopt};
        std::optional<SharedData::ErrorAction> defaultErrorAction{std::nullopt};
        std::optional<std::chrono::milliseconds> errorResponseTimeout{std::nullopt};
        std::optional<std::chrono::milliseconds> completedRetention{std::nullopt};
        std::optional<bool> recordUndoHistory{std::nullopt};
        std::optional<Log::Level> logLevel{std::nullopt};
        std::optional<std::filesystem::path> logFile{std::nullopt};

        void useDefaultsFrom(EngineOptions const& other);

        /**
         * @brief Every field except logFile set to its built-in default.
         */
        static EngineOptions defaults();
    };
    void to_json(nlohmann::json& j, EngineOptions const& options);
    void from_json(nlohmann::json const& j, EngineOptions& options);

    /**
     * @brief Reads options from a JSON file and fills unset fields with defaults.
     * A missing file yields the defaults.
     *
     * @return An error description if the file cannot be parsed.
     */
    std::expected<EngineOptions, std::string> loadEngineOptions(std::filesystem::path const& path);

    /**
     * @brief Writes options as JSON, creating parent directories as needed.
     */
    std::expected<void, std::string> saveEngineOptions(std::filesystem::path const& path, EngineOptions const& options);
}
