#include "test_conflict_resolver.hpp"
#include "test_execution.hpp"
#include "test_operation_dispatcher.hpp"
#include "test_operation_manager.hpp"
#include "test_undo_log.hpp"

#include <log/log.hpp>

#include <gtest/gtest.h>

#include <filesystem>

std::filesystem::path programDirectory;

int main(int argc, char** argv)
{
    Log::setLevel(Log::Level::Off);

    programDirectory = std::filesystem::path{argv[0]}.parent_path();

    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
