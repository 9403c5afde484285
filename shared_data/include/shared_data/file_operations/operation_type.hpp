#pragma once

#include <shared_data/shared_data.hpp>
#include <utility/describe.hpp>

#include <string>

namespace SharedData
{
    BOOST_DEFINE_ENUM_CLASS(OperationType, Copy, Move, Delete)

    /**
     * @brief Progressive verb for display, e.g. "Copying".
     */
    inline std::string operationTypeVerb(OperationType type)
    {
        switch (type)
        {
            case OperationType::Copy:
                return "Copying";
            case OperationType::Move:
                return "Moving";
            case OperationType::Delete:
                return "Deleting";
        }
        return "Processing";
    }
}
