#include <utility/temporary_directory.hpp>

#include <cstdlib>
#include <random>
#include <stdexcept>
#include <string>
#include <string_view>

using namespace std::string_literals;

namespace Utility
{
    namespace
    {
        [[maybe_unused]] std::string generateRandomString(int length)
        {
            static constexpr std::string_view characters = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz";

            std::random_device device{};
            std::mt19937 rng(device());
            std::uniform_int_distribution<std::size_t> distribution(0, characters.size() - 1);

            std::string randomString;
            randomString.reserve(static_cast<std::size_t>(length));
            for (int i = 0; i < length; ++i)
                randomString += characters[distribution(rng)];

            return randomString;
        }
    }

    TemporaryDirectory::TemporaryDirectory()
        : TemporaryDirectory{std::filesystem::temp_directory_path() / "fileops_tmpdir", true}
    {}

    TemporaryDirectory::TemporaryDirectory(std::filesystem::path basePath, bool removeBaseIfEmpty)
        : basePath_{std::move(basePath)}
        , path_{}
        , removeBaseIfEmpty_{removeBaseIfEmpty}
    {
        std::error_code ec{};
        std::filesystem::create_directories(basePath_, ec);
        if (ec)
            throw std::runtime_error("Could not create base of temporary directory: "s + ec.message());

#if __linux__
        std::string dirNameAsString{(basePath_ / "dirXXXXXX").string()};
        const bool valid = mkdtemp(dirNameAsString.data()) != nullptr && std::filesystem::is_directory(dirNameAsString);
        if (valid)
            path_ = dirNameAsString;
#else
        int i = 0;
        for (; i != 1000; ++i)
        {
            const auto path = basePath_ / ("dir"s + generateRandomString(10));
            if (std::filesystem::create_directory(path, ec) && !ec)
            {
                path_ = path;
                break;
            }
        }
        const bool valid = i != 1000;
#endif
        if (!valid)
            throw std::runtime_error("Could not setup temporary directory in: "s + basePath_.string());
    }

    TemporaryDirectory::~TemporaryDirectory()
    {
        std::error_code error;
        std::filesystem::remove_all(path_, error);
        if (removeBaseIfEmpty_ && std::filesystem::is_empty(basePath_, error))
            std::filesystem::remove(basePath_, error);
    }

    std::filesystem::path const& TemporaryDirectory::path() const
    {
        return path_;
    }
}
