#pragma once

#include <async/cancellation_token.hpp>
#include <async/mailbox.hpp>
#include <engine/execution.hpp>
#include <engine/mocks/file_system_mock.hpp>
#include <shared_data/file_operations/progress_update.hpp>
#include <utility/overloaded.hpp>
#include <utility/temporary_directory.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <string>
#include <utility>
#include <vector>

extern std::filesystem::path programDirectory;

namespace Engine::Test
{
    namespace Updates = SharedData::ProgressUpdates;

    inline std::string eventName(SharedData::ProgressUpdate const& update)
    {
        return std::visit(
            Utility::overloaded{
                [](Updates::Started const&) {
                    return std::string{"Started"};
                },
                [](Updates::TotalsCalculated const&) {
                    return std::string{"TotalsCalculated"};
                },
                [](Updates::FileStarted const&) {
                    return std::string{"FileStarted"};
                },
                [](Updates::BytesTransferred const&) {
                    return std::string{"BytesTransferred"};
                },
                [](Updates::FileCompleted const&) {
                    return std::string{"FileCompleted"};
                },
                [](Updates::FileSkipped const&) {
                    return std::string{"FileSkipped"};
                },
                [](Updates::Error const&) {
                    return std::string{"Error"};
                },
                [](Updates::Completed const&) {
                    return std::string{"Completed"};
                },
                [](Updates::Cancelled const&) {
                    return std::string{"Cancelled"};
                },
                [](Updates::Failed const&) {
                    return std::string{"Failed"};
                },
            },
            update);
    }

    /**
     * @brief Cancels a token as soon as the first chunk was read.
     */
    class CancellingReadStream : public IReadStream
    {
      public:
        CancellingReadStream(std::unique_ptr<IReadStream> inner, Async::CancellationToken token)
            : inner_{std::move(inner)}
            , token_{std::move(token)}
        {}

        std::expected<std::size_t, std::error_code> read(std::span<char> buffer) override
        {
            auto result = inner_->read(buffer);
            token_.cancel();
            return result;
        }

      private:
        std::unique_ptr<IReadStream> inner_;
        Async::CancellationToken token_;
    };

    class CommonFixture : public ::testing::Test
    {
      protected:
        using FileSystemMockPtr = std::shared_ptr<::testing::NiceMock<FileSystemMock>>;

        std::filesystem::path root() const
        {
            return isolateDirectory_.path();
        }

        std::filesystem::path writeFile(std::filesystem::path const& path, std::string const& content)
        {
            std::filesystem::create_directories(path.parent_path());
            std::ofstream writer{path, std::ios_base::binary};
            writer << content;
            return path;
        }

        std::string readFile(std::filesystem::path const& path)
        {
            std::ifstream reader{path, std::ios_base::binary};
            return std::string{std::istreambuf_iterator<char>{reader}, std::istreambuf_iterator<char>{}};
        }

        std::filesystem::path makeDirectory(std::filesystem::path const& path)
        {
            std::filesystem::create_directories(path);
            return path;
        }

        static std::string makeContent(std::size_t size)
        {
            std::string content;
            content.reserve(size);
            for (std::size_t i = 0; i != size; ++i)
                content.push_back(static_cast<char>('a' + i % 26));
            return content;
        }

        FileSystemMockPtr makeFileSystemMock()
        {
            return std::make_shared<::testing::NiceMock<FileSystemMock>>();
        }

        /**
         * @brief Makes opening path for reading fail failCount times, or always if failCount is negative.
         * The returned counter tracks the attempts.
         */
        std::shared_ptr<int>
        failReadsOf(FileSystemMockPtr const& mock, std::filesystem::path const& path, std::errc errc, int failCount = -1)
        {
            auto calls = std::make_shared<int>(0);
            ON_CALL(*mock, openForReading(::testing::Eq(path)))
                .WillByDefault([mock = mock.get(), calls, errc, failCount](std::filesystem::path const& requested)
                                   -> std::expected<std::unique_ptr<IReadStream>, std::error_code> {
                    ++*calls;
                    if (failCount < 0 || *calls <= failCount)
                        return std::unexpected(std::make_error_code(errc));
                    return mock->real().openForReading(requested);
                });
            return calls;
        }

        std::vector<SharedData::ProgressUpdate> drainUpdates()
        {
            return mailbox_.second.drain();
        }

        static std::vector<std::string> eventNames(std::vector<SharedData::ProgressUpdate> const& updates)
        {
            std::vector<std::string> names;
            for (auto const& update : updates)
                names.push_back(eventName(update));
            return names;
        }

        template <typename Event>
        static std::vector<Event> eventsOf(std::vector<SharedData::ProgressUpdate> const& updates)
        {
            std::vector<Event> events;
            for (auto const& update : updates)
            {
                if (auto const* event = std::get_if<Event>(&update))
                    events.push_back(*event);
            }
            return events;
        }

        ProgressSender const& progress() const
        {
            return mailbox_.first;
        }

      protected:
        Utility::TemporaryDirectory isolateDirectory_{programDirectory / "temp", true};
        Async::CancellationToken cancellationToken_{};
        Ids::OperationId id_{Ids::makeOperationId(1)};
        std::pair<ProgressSender, Async::Receiver<SharedData::ProgressUpdate>> mailbox_{
            Async::makeMailbox<SharedData::ProgressUpdate>()};
    };
}
