#pragma once

#include <engine/file_system.hpp>

#include <gmock/gmock.h>

namespace Engine::Test
{
    /**
     * @brief Forwards every call to the local file system unless a test overrides it.
     */
    class FileSystemMock : public IFileSystem
    {
      public:
        FileSystemMock()
        {
            using namespace ::testing;

            ON_CALL(*this, exists).WillByDefault([this](std::filesystem::path const& path) {
                return real_.exists(path);
            });
            ON_CALL(*this, isDirectory).WillByDefault([this](std::filesystem::path const& path) {
                return real_.isDirectory(path);
            });
            ON_CALL(*this, fileSize).WillByDefault([this](std::filesystem::path const& path) {
                return real_.fileSize(path);
            });
            ON_CALL(*this, lastWriteTime).WillByDefault([this](std::filesystem::path const& path) {
                return real_.lastWriteTime(path);
            });
            ON_CALL(*this, listDirectory).WillByDefault([this](std::filesystem::path const& path) {
                return real_.listDirectory(path);
            });
            ON_CALL(*this, openForReading).WillByDefault([this](std::filesystem::path const& path) {
                return real_.openForReading(path);
            });
            ON_CALL(*this, openForWriting).WillByDefault([this](std::filesystem::path const& path) {
                return real_.openForWriting(path);
            });
            ON_CALL(*this, createDirectories).WillByDefault([this](std::filesystem::path const& path) {
                return real_.createDirectories(path);
            });
            ON_CALL(*this, rename).WillByDefault([this](std::filesystem::path const& from, std::filesystem::path const& to) {
                return real_.rename(from, to);
            });
            ON_CALL(*this, removeFile).WillByDefault([this](std::filesystem::path const& path) {
                return real_.removeFile(path);
            });
            ON_CALL(*this, removeAll).WillByDefault([this](std::filesystem::path const& path) {
                return real_.removeAll(path);
            });
        }

        MOCK_METHOD(bool, exists, (std::filesystem::path const&), (const, override));
        MOCK_METHOD(bool, isDirectory, (std::filesystem::path const&), (const, override));
        MOCK_METHOD((std::expected<std::uint64_t, std::error_code>), fileSize, (std::filesystem::path const&), (const, override));
        MOCK_METHOD(std::optional<SharedData::TimePoint>, lastWriteTime, (std::filesystem::path const&), (const, override));
        MOCK_METHOD(
            (std::expected<std::vector<std::filesystem::path>, std::error_code>),
            listDirectory,
            (std::filesystem::path const&),
            (const, override));
        MOCK_METHOD(
            (std::expected<std::unique_ptr<IReadStream>, std::error_code>),
            openForReading,
            (std::filesystem::path const&),
            (const, override));
        MOCK_METHOD(
            (std::expected<std::unique_ptr<IWriteStream>, std::error_code>),
            openForWriting,
            (std::filesystem::path const&),
            (override));
        MOCK_METHOD(std::error_code, createDirectories, (std::filesystem::path const&), (override));
        MOCK_METHOD(std::error_code, rename, (std::filesystem::path const&, std::filesystem::path const&), (override));
        MOCK_METHOD(std::error_code, removeFile, (std::filesystem::path const&), (override));
        MOCK_METHOD(std::error_code, removeAll, (std::filesystem::path const&), (override));

        LocalFileSystem& real()
        {
            return real_;
        }

      private:
        LocalFileSystem real_{};
    };
}
