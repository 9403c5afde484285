#pragma once

#include <shared_data/shared_data.hpp>
#include <utility/describe.hpp>

#include <nlohmann/json.hpp>

#include <filesystem>
#include <string>
#include <system_error>

namespace SharedData
{
    BOOST_DEFINE_ENUM_CLASS(
        OperationErrorKind,
        PermissionDenied,
        FileNotFound,
        AlreadyExists,
        DiskFull,
        NetworkError,
        ReadOnly,
        InUse,
        InvalidPath,
        Unknown)

    /**
     * @brief A failure of a single file system step of an operation.
     */
    struct OperationError
    {
        std::filesystem::path filePath{};
        std::string message{};
        bool isRecoverable{false};
        OperationErrorKind kind{OperationErrorKind::Unknown};

        /**
         * @brief Classifies an error code. Permission denied, already exists and not found are recoverable,
         * retrying them can succeed once the user fixed the cause.
         */
        static OperationError fromErrorCode(std::filesystem::path const& filePath, std::error_code const& ec);

        /**
         * @brief Text for display to the user.
         */
        std::string userMessage() const;

        std::string toString() const;
    };

    void to_json(nlohmann::json& j, OperationError const& error);
}
