#pragma once

#include <shared_data/time_point.hpp>

#include <cstddef>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <memory>
#include <optional>
#include <span>
#include <system_error>
#include <vector>

namespace Engine
{
    class IReadStream
    {
      public:
        virtual ~IReadStream() = default;

        /**
         * @brief Reads up to buffer.size() bytes.
         *
         * @return The number of bytes read, 0 at the end of the file.
         */
        virtual std::expected<std::size_t, std::error_code> read(std::span<char> buffer) = 0;
    };

    class IWriteStream
    {
      public:
        virtual ~IWriteStream() = default;

        virtual std::error_code write(std::span<char const> data) = 0;

        /**
         * @brief Flushes and closes the file. Further writes are invalid.
         */
        virtual std::error_code close() = 0;
    };

    /**
     * @brief Every file system access of the execution engine goes through this interface.
     */
    class IFileSystem
    {
      public:
        virtual ~IFileSystem() = default;

        virtual bool exists(std::filesystem::path const& path) const = 0;
        virtual bool isDirectory(std::filesystem::path const& path) const = 0;
        virtual std::expected<std::uint64_t, std::error_code> fileSize(std::filesystem::path const& path) const = 0;
        virtual std::optional<SharedData::TimePoint> lastWriteTime(std::filesystem::path const& path) const = 0;

        /**
         * @brief Direct children of a directory, sorted by name.
         */
        virtual std::expected<std::vector<std::filesystem::path>, std::error_code>
        listDirectory(std::filesystem::path const& path) const = 0;

        virtual std::expected<std::unique_ptr<IReadStream>, std::error_code>
        openForReading(std::filesystem::path const& path) const = 0;

        /**
         * @brief Creates or truncates a file.
         */
        virtual std::expected<std::unique_ptr<IWriteStream>, std::error_code>
        openForWriting(std::filesystem::path const& path) = 0;

        virtual std::error_code createDirectories(std::filesystem::path const& path) = 0;
        virtual std::error_code rename(std::filesystem::path const& from, std::filesystem::path const& to) = 0;
        virtual std::error_code removeFile(std::filesystem::path const& path) = 0;
        virtual std::error_code removeAll(std::filesystem::path const& path) = 0;
    };

    /**
     * @brief The real file system of this machine.
     */
    class LocalFileSystem : public IFileSystem
    {
      public:
        bool exists(std::filesystem::path const& path) const override;
        bool isDirectory(std::filesystem::path const& path) const override;
        std::expected<std::uint64_t, std::error_code> fileSize(std::filesystem::path const& path) const override;
        std::optional<SharedData::TimePoint> lastWriteTime(std::filesystem::path const& path) const override;
        std::expected<std::vector<std::filesystem::path>, std::error_code>
        listDirectory(std::filesystem::path const& path) const override;
        std::expected<std::unique_ptr<IReadStream>, std::error_code>
        openForReading(std::filesystem::path const& path) const override;
        std::expected<std::unique_ptr<IWriteStream>, std::error_code>
        openForWriting(std::filesystem::path const& path) override;
        std::error_code createDirectories(std::filesystem::path const& path) override;
        std::error_code rename(std::filesystem::path const& from, std::filesystem::path const& to) override;
        std::error_code removeFile(std::filesystem::path const& path) override;
        std::error_code removeAll(std::filesystem::path const& path) override;
    };
}
