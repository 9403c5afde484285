#include <engine/file_system.hpp>

#include <algorithm>
#include <cerrno>
#include <fstream>

namespace Engine
{
    namespace
    {
        // File streams do not report why they failed, errno still holds the reason of the failed system call.
        std::error_code lastStreamError()
        {
            if (errno != 0)
                return {errno, std::generic_category()};
            return std::make_error_code(std::errc::io_error);
        }

        class LocalReadStream : public IReadStream
        {
          public:
            explicit LocalReadStream(std::ifstream stream)
                : stream_{std::move(stream)}
            {}

            std::expected<std::size_t, std::error_code> read(std::span<char> buffer) override
            {
                errno = 0;
                stream_.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
                if (stream_.bad())
                    return std::unexpected(lastStreamError());
                return static_cast<std::size_t>(stream_.gcount());
            }

          private:
            std::ifstream stream_;
        };

        class LocalWriteStream : public IWriteStream
        {
          public:
            explicit LocalWriteStream(std::ofstream stream)
                : stream_{std::move(stream)}
            {}

            std::error_code write(std::span<char const> data) override
            {
                errno = 0;
                stream_.write(data.data(), static_cast<std::streamsize>(data.size()));
                if (!stream_.good())
                    return lastStreamError();
                return {};
            }

            std::error_code close() override
            {
                errno = 0;
                stream_.flush();
                stream_.close();
                if (stream_.fail())
                    return lastStreamError();
                return {};
            }

          private:
            std::ofstream stream_;
        };
    }

    bool LocalFileSystem::exists(std::filesystem::path const& path) const
    {
        std::error_code ec;
        return std::filesystem::exists(std::filesystem::symlink_status(path, ec));
    }

    bool LocalFileSystem::isDirectory(std::filesystem::path const& path) const
    {
        std::error_code ec;
        return std::filesystem::is_directory(std::filesystem::symlink_status(path, ec));
    }

    std::expected<std::uint64_t, std::error_code> LocalFileSystem::fileSize(std::filesystem::path const& path) const
    {
        std::error_code ec;
        const auto size = std::filesystem::file_size(path, ec);
        if (ec)
            return std::unexpected(ec);
        return static_cast<std::uint64_t>(size);
    }

    std::optional<SharedData::TimePoint> LocalFileSystem::lastWriteTime(std::filesystem::path const& path) const
    {
        std::error_code ec;
        const auto time = std::filesystem::last_write_time(path, ec);
        if (ec)
            return std::nullopt;
        return std::chrono::time_point_cast<SharedData::Clock::duration>(std::chrono::file_clock::to_sys(time));
    }

    std::expected<std::vector<std::filesystem::path>, std::error_code>
    LocalFileSystem::listDirectory(std::filesystem::path const& path) const
    {
        std::error_code ec;
        std::vector<std::filesystem::path> children;
        for (auto iter = std::filesystem::directory_iterator{path, ec}; !ec && iter != std::filesystem::directory_iterator{};
             iter.increment(ec))
        {
            children.push_back(iter->path());
        }
        if (ec)
            return std::unexpected(ec);
        std::sort(children.begin(), children.end());
        return children;
    }

    std::expected<std::unique_ptr<IReadStream>, std::error_code>
    LocalFileSystem::openForReading(std::filesystem::path const& path) const
    {
        errno = 0;
        std::ifstream stream{path, std::ios_base::binary};
        if (!stream.is_open())
            return std::unexpected(lastStreamError());
        return std::make_unique<LocalReadStream>(std::move(stream));
    }

    std::expected<std::unique_ptr<IWriteStream>, std::error_code>
    LocalFileSystem::openForWriting(std::filesystem::path const& path)
    {
        errno = 0;
        std::ofstream stream{path, std::ios_base::binary | std::ios_base::trunc};
        if (!stream.is_open())
            return std::unexpected(lastStreamError());
        return std::make_unique<LocalWriteStream>(std::move(stream));
    }

    std::error_code LocalFileSystem::createDirectories(std::filesystem::path const& path)
    {
        std::error_code ec;
        std::filesystem::create_directories(path, ec);
        return ec;
    }

    std::error_code LocalFileSystem::rename(std::filesystem::path const& from, std::filesystem::path const& to)
    {
        std::error_code ec;
        std::filesystem::rename(from, to, ec);
        return ec;
    }

    std::error_code LocalFileSystem::removeFile(std::filesystem::path const& path)
    {
        std::error_code ec;
        if (!std::filesystem::remove(path, ec) && !ec)
            return std::make_error_code(std::errc::no_such_file_or_directory);
        return ec;
    }

    std::error_code LocalFileSystem::removeAll(std::filesystem::path const& path)
    {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
        return ec;
    }
}
