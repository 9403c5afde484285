#pragma once

#include <filesystem>

namespace Utility
{
    /**
     * @brief Creates a uniquely named directory below a base directory and removes it again on destruction.
     */
    class TemporaryDirectory
    {
      public:
        TemporaryDirectory();

        /**
         * @param basePath Directory the temporary directory is created in. Created if missing.
         * @param removeBaseIfEmpty Remove basePath too on destruction, if nothing else remains inside.
         */
        TemporaryDirectory(std::filesystem::path basePath, bool removeBaseIfEmpty);
        ~TemporaryDirectory();

        TemporaryDirectory(TemporaryDirectory const&) = delete;
        TemporaryDirectory& operator=(TemporaryDirectory const&) = delete;

        TemporaryDirectory(TemporaryDirectory&&) = delete;
        TemporaryDirectory& operator=(TemporaryDirectory&&) = delete;

        std::filesystem::path const& path() const;

      private:
        std::filesystem::path basePath_;
        std::filesystem::path path_;
        bool removeBaseIfEmpty_;
    };
}
