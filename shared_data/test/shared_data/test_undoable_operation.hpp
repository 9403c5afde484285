#pragma once

#include <shared_data/file_operations/progress_update.hpp>
#include <shared_data/file_operations/undoable_operation.hpp>

#include <gtest/gtest.h>

namespace SharedData::Test
{
    class UndoableOperationTests : public ::testing::Test
    {
      protected:
        Ids::OperationId id_{Ids::makeOperationId(3)};
    };

    TEST_F(UndoableOperationTests, SingleItemDescriptionNamesTheFile)
    {
        EXPECT_EQ(UndoableOperation::copy(id_, {"/x/a.txt"}).description(), "Copy \"a.txt\"");
        EXPECT_EQ(UndoableOperation::move(id_, {"/x/a.txt"}, {"/y/a.txt"}).description(), "Move \"a.txt\"");
        EXPECT_EQ(UndoableOperation::remove(id_, {"/x/a.txt"}, {"/t/a.txt"}).description(), "Delete \"a.txt\"");
    }

    TEST_F(UndoableOperationTests, BatchDescriptionCountsItems)
    {
        EXPECT_EQ(UndoableOperation::copy(id_, {"/a", "/b", "/c"}).description(), "Copy 3 items");
        EXPECT_EQ(UndoableOperation::move(id_, {"/a", "/b"}, {"/x/a", "/x/b"}).description(), "Move 2 items");
    }

    TEST_F(UndoableOperationTests, RenameDescriptionNamesBothNames)
    {
        EXPECT_EQ(UndoableOperation::rename(id_, "/x/old.txt", "/x/new.txt").description(), "Rename \"old.txt\" to \"new.txt\"");
    }

    TEST_F(UndoableOperationTests, FactoriesSelectTheAction)
    {
        EXPECT_TRUE(UndoableOperation::copy(id_, {"/a"}).is<UndoableOperation::CopyAction>());
        EXPECT_TRUE(UndoableOperation::move(id_, {"/a"}, {"/b"}).is<UndoableOperation::MoveAction>());
        EXPECT_TRUE(UndoableOperation::rename(id_, "/a", "/b").is<UndoableOperation::RenameAction>());
        EXPECT_TRUE(UndoableOperation::remove(id_, {"/a"}, {"/t"}).is<UndoableOperation::DeleteAction>());
    }

    TEST_F(UndoableOperationTests, JsonCarriesTypeAndPaths)
    {
        nlohmann::json j = UndoableOperation::move(id_, {"/a"}, {"/b"});
        EXPECT_EQ(j["type"], "Move");
        EXPECT_EQ(j["operationId"], 3);
        EXPECT_EQ(j["originalPaths"], nlohmann::json::array({"/a"}));
        EXPECT_EQ(j["newPaths"], nlohmann::json::array({"/b"}));
    }

    TEST_F(UndoableOperationTests, EveryProgressUpdateNamesItsOperation)
    {
        ProgressUpdate update = ProgressUpdates::FileStarted{.operationId = id_, .file = "a.txt"};
        EXPECT_EQ(operationIdOf(update), id_);
        update = ProgressUpdates::Completed{.operationId = id_};
        EXPECT_EQ(operationIdOf(update), id_);
    }
}
