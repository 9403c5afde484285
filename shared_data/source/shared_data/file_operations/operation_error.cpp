#include <shared_data/file_operations/operation_error.hpp>

#include <fmt/format.h>

namespace SharedData
{
    namespace
    {
        struct Classification
        {
            OperationErrorKind kind;
            bool isRecoverable;
        };

        Classification classify(std::error_code const& ec)
        {
            using enum OperationErrorKind;

            const auto condition = ec.default_error_condition();
            if (condition.category() != std::generic_category())
                return {Unknown, false};

            switch (static_cast<std::errc>(condition.value()))
            {
                case std::errc::permission_denied:
                case std::errc::operation_not_permitted:
                    return {PermissionDenied, true};
                case std::errc::file_exists:
                    return {AlreadyExists, true};
                case std::errc::no_such_file_or_directory:
                    return {FileNotFound, true};
                case std::errc::invalid_argument:
                case std::errc::filename_too_long:
                case std::errc::not_a_directory:
                case std::errc::is_a_directory:
                    return {InvalidPath, false};
                case std::errc::no_space_on_device:
                case std::errc::file_too_large:
                    return {DiskFull, false};
                case std::errc::read_only_file_system:
                    return {ReadOnly, false};
                case std::errc::device_or_resource_busy:
                case std::errc::text_file_busy:
                case std::errc::resource_unavailable_try_again:
                    return {InUse, false};
                case std::errc::network_down:
                case std::errc::network_unreachable:
                case std::errc::network_reset:
                case std::errc::connection_aborted:
                case std::errc::connection_refused:
                case std::errc::connection_reset:
                case std::errc::host_unreachable:
                case std::errc::timed_out:
                    return {NetworkError, false};
                default:
                    return {Unknown, false};
            }
        }
    }

    OperationError OperationError::fromErrorCode(std::filesystem::path const& filePath, std::error_code const& ec)
    {
        const auto classification = classify(ec);
        return OperationError{
            .filePath = filePath,
            .message = ec.message(),
            .isRecoverable = classification.isRecoverable,
            .kind = classification.kind,
        };
    }

    std::string OperationError::userMessage() const
    {
        const auto path = filePath.string();
        switch (kind)
        {
            case OperationErrorKind::PermissionDenied:
                return fmt::format("Permission denied: {}", path);
            case OperationErrorKind::FileNotFound:
                return fmt::format("File not found: {}", path);
            case OperationErrorKind::AlreadyExists:
                return fmt::format("File already exists: {}", path);
            case OperationErrorKind::DiskFull:
                return "Not enough disk space to complete the operation";
            case OperationErrorKind::NetworkError:
                return fmt::format("Network error accessing: {}", path);
            case OperationErrorKind::ReadOnly:
                return fmt::format("Destination is read-only: {}", path);
            case OperationErrorKind::InUse:
                return fmt::format("File is in use: {}", path);
            case OperationErrorKind::InvalidPath:
                return fmt::format("Invalid path: {}", path);
            case OperationErrorKind::Unknown:
                return message;
        }
        return message;
    }

    std::string OperationError::toString() const
    {
        return fmt::format(
            "{} ({}{}): {}",
            Utility::enumToString(kind),
            isRecoverable ? "recoverable" : "not recoverable",
            filePath.empty() ? std::string{} : ", " + filePath.string(),
            message);
    }

    void to_json(nlohmann::json& j, OperationError const& error)
    {
        j = nlohmann::json{
            {"filePath", pathToJson(error.filePath)},
            {"message", error.message},
            {"isRecoverable", error.isRecoverable},
            {"kind", Utility::enumToString(error.kind)},
            {"userMessage", error.userMessage()},
        };
    }
}
