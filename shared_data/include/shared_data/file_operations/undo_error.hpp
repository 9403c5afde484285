#pragma once

#include <shared_data/shared_data.hpp>
#include <utility/describe.hpp>

#include <fmt/format.h>

#include <string>

namespace SharedData
{
    BOOST_DEFINE_ENUM_CLASS(UndoErrorType, NothingToUndo, NothingToRedo, FileSystemError, OperationNotReversible)

    struct UndoError
    {
        UndoErrorType type;
        std::string detail{};

        std::string toString() const
        {
            switch (type)
            {
                case UndoErrorType::NothingToUndo:
                    return "Nothing to undo";
                case UndoErrorType::NothingToRedo:
                    return "Nothing to redo";
                case UndoErrorType::FileSystemError:
                    return fmt::format("File system error: {}", detail);
                case UndoErrorType::OperationNotReversible:
                    return fmt::format("Operation cannot be reversed: {}", detail);
            }
            return Utility::enumToString(type);
        }
    };
}
