#include "test_file_operation.hpp"
#include "test_operation_error.hpp"
#include "test_operation_progress.hpp"
#include "test_undoable_operation.hpp"

#include <log/log.hpp>

#include <gtest/gtest.h>

int main(int argc, char** argv)
{
    Log::setLevel(Log::Level::Off);

    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
