#pragma once

#include <ids/id.hpp>

DEFINE_ID_TYPE(OperationId)

namespace Ids
{
    using OperationIdAllocator = IdAllocator<OperationId>;
}
