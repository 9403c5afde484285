#include <log/log.hpp>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <vector>

namespace Log
{
    namespace Detail
    {
        Logger logger{};
    }

    Logger::Logger()
        : guard_{}
        , logger_{std::make_shared<spdlog::logger>(
              "fileops",
              std::make_shared<spdlog::sinks::stdout_color_sink_mt>())}
    {
        logger_->set_level(spdlog::level::info);
    }

    std::expected<void, std::string> Logger::setup(LogOptions const& options)
    {
        std::vector<spdlog::sink_ptr> sinks{};
        if (options.console)
            sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

        if (options.file)
        {
            try
            {
                sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(options.file->string(), false));
            }
            catch (spdlog::spdlog_ex const& exc)
            {
                return std::unexpected(std::string{"Cannot open log file: "} + exc.what());
            }
        }

        auto logger = std::make_shared<spdlog::logger>("fileops", sinks.begin(), sinks.end());
        logger->set_pattern(options.pattern);
        logger->set_level(toSpdlogLevel(options.level));
        logger->flush_on(spdlog::level::warn);

        std::scoped_lock lock{guard_};
        logger_ = std::move(logger);
        return {};
    }

    std::expected<void, std::string> setup(LogOptions const& options)
    {
        return Detail::logger.setup(options);
    }
}
