#include <persistence/engine_options.hpp>
#include <log/log.hpp>
#include <utility/enum_string_convert.hpp>

#include <fstream>

namespace Persistence
{
    namespace
    {
        nlohmann::json secondsToJson(std::chrono::milliseconds duration)
        {
            return static_cast<double>(duration.count()) / 1000.0;
        }

        std::chrono::milliseconds secondsFromJson(nlohmann::json const& j)
        {
            return std::chrono::milliseconds{static_cast<long long>(j.get<double>() * 1000.0)};
        }
    }

    EngineOptions EngineOptions::defaults()
    {
        return EngineOptions{
            .chunkSize = 64 * 1024,
            .maxUndoHistory = 50,
            .interactiveErrors = true,
            .defaultErrorAction = SharedData::ErrorAction::Skip,
            .errorResponseTimeout = std::chrono::seconds{300},
            .completedRetention = std::chrono::seconds{60},
            .recordUndoHistory = true,
            .logLevel = Log::Level::Info,
            .logFile = std::nullopt,
        };
    }

    void EngineOptions::useDefaultsFrom(EngineOptions const& other)
    {
        if (!chunkSize)
            chunkSize = other.chunkSize;
        if (!maxUndoHistory)
            maxUndoHistory = other.maxUndoHistory;
        if (!interactiveErrors)
            interactiveErrors = other.interactiveErrors;
        if (!defaultErrorAction)
            defaultErrorAction = other.defaultErrorAction;
        if (!errorResponseTimeout)
            errorResponseTimeout = other.errorResponseTimeout;
        if (!completedRetention)
            completedRetention = other.completedRetention;
        if (!recordUndoHistory)
            recordUndoHistory = other.recordUndoHistory;
        if (!logLevel)
            logLevel = other.logLevel;
        if (!logFile)
            logFile = other.logFile;
    }

    void to_json(nlohmann::json& j, EngineOptions const& options)
    {
        j = nlohmann::json::object();
        if (options.chunkSize)
            j["chunkSize"] = *options.chunkSize;
        if (options.maxUndoHistory)
            j["maxUndoHistory"] = *options.maxUndoHistory;
        if (options.interactiveErrors)
            j["interactiveErrors"] = *options.interactiveErrors;
        if (options.defaultErrorAction)
            j["defaultErrorAction"] = Utility::enumToString(*options.defaultErrorAction);
        if (options.errorResponseTimeout)
            j["errorResponseTimeout"] = secondsToJson(*options.errorResponseTimeout);
        if (options.completedRetention)
            j["completedRetention"] = secondsToJson(*options.completedRetention);
        if (options.recordUndoHistory)
            j["recordUndoHistory"] = *options.recordUndoHistory;
        if (options.logLevel)
            j["logLevel"] = Log::levelToString(*options.logLevel);
        if (options.logFile)
            j["logFile"] = options.logFile->generic_string();
    }

    void from_json(nlohmann::json const& j, EngineOptions& options)
    {
        if (j.contains("chunkSize"))
            options.chunkSize = j["chunkSize"].get<std::size_t>();
        if (j.contains("maxUndoHistory"))
            options.maxUndoHistory = j["maxUndoHistory"].get<std::size_t>();
        if (j.contains("interactiveErrors"))
            options.interactiveErrors = j["interactiveErrors"].get<bool>();
        if (j.contains("defaultErrorAction"))
            options.defaultErrorAction =
                Utility::enumFromString<SharedData::ErrorAction>(j["defaultErrorAction"].get<std::string>());
        if (j.contains("errorResponseTimeout"))
            options.errorResponseTimeout = secondsFromJson(j["errorResponseTimeout"]);
        if (j.contains("completedRetention"))
            options.completedRetention = secondsFromJson(j["completedRetention"]);
        if (j.contains("recordUndoHistory"))
            options.recordUndoHistory = j["recordUndoHistory"].get<bool>();
        if (j.contains("logLevel"))
            options.logLevel = Log::levelFromString(j["logLevel"].get<std::string>());
        if (j.contains("logFile"))
            options.logFile = std::filesystem::path{j["logFile"].get<std::string>()};
    }

    std::expected<EngineOptions, std::string> loadEngineOptions(std::filesystem::path const& path)
    {
        std::ifstream reader{path, std::ios_base::binary};
        if (!reader.good())
        {
            Log::warn("Engine options file '{}' does not exist, using defaults.", path.string());
            return EngineOptions::defaults();
        }

        try
        {
            auto options = nlohmann::json::parse(reader, nullptr, true, true).get<EngineOptions>();
            options.useDefaultsFrom(EngineOptions::defaults());
            if (*options.chunkSize == 0)
                return std::unexpected(std::string{"chunkSize must not be 0"});
            return options;
        }
        catch (std::exception const& e)
        {
            Log::error("Failed to parse engine options '{}': {}", path.string(), e.what());
            return std::unexpected(std::string{"Failed to parse engine options: "} + e.what());
        }
    }

    std::expected<void, std::string> saveEngineOptions(std::filesystem::path const& path, EngineOptions const& options)
    {
        std::error_code ec;
        if (path.has_parent_path())
        {
            std::filesystem::create_directories(path.parent_path(), ec);
            if (ec)
                return std::unexpected("Cannot create directory for engine options: " + ec.message());
        }

        std::ofstream writer{path, std::ios_base::binary | std::ios_base::trunc};
        if (!writer.good())
            return std::unexpected("Cannot open engine options file for writing: " + path.string());

        writer << nlohmann::json(options).dump(4);
        if (!writer.good())
            return std::unexpected("Failed to write engine options file: " + path.string());
        return {};
    }
}
