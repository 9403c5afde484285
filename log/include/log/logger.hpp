#pragma once

#include <log/level.hpp>

#include <spdlog/spdlog.h>

#include <expected>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace Log
{
    struct LogOptions
    {
        Level level{Level::Info};
        bool console{true};
        std::optional<std::filesystem::path> file{std::nullopt};
        std::string pattern{"[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v"};
    };

    class Logger
    {
      public:
        Logger();

        /**
         * @brief Replaces the sinks of the logger.
         *
         * @return An error description if a sink could not be created. The previous sinks stay in place then.
         */
        std::expected<void, std::string> setup(LogOptions const& options);

        void setLevel(Log::Level level)
        {
            current()->set_level(toSpdlogLevel(level));
        }

        Log::Level level() const
        {
            return fromSpdlogLevel(current()->level());
        }

        template <typename... Args>
        void log(Log::Level level, std::string_view fmt, Args&&... args)
        {
            const auto logger = current();
            const auto spdlogLevel = toSpdlogLevel(level);
            if (!logger->should_log(spdlogLevel))
                return;

            const std::string message =
                spdlog::fmt_lib::format(spdlog::fmt_lib::runtime(fmt), std::forward<Args>(args)...);
            logger->log(spdlogLevel, message);
        }

      private:
        std::shared_ptr<spdlog::logger> current() const
        {
            std::scoped_lock lock{guard_};
            return logger_;
        }

      private:
        mutable std::mutex guard_;
        std::shared_ptr<spdlog::logger> logger_;
    };
}
