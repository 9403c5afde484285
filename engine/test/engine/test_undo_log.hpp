#pragma once

#include "common_fixture.hpp"

#include <engine/undo_log.hpp>

#include <gtest/gtest.h>

namespace Engine::Test
{
    class UndoLogTests : public CommonFixture
    {
      protected:
        SharedData::UndoableOperation copyOf(std::uint64_t id, std::filesystem::path path)
        {
            return SharedData::UndoableOperation::copy(Ids::makeOperationId(id), {std::move(path)});
        }

        UndoLog log_{};
    };

    TEST_F(UndoLogTests, EmptyLogHasNothingToUndoOrRedo)
    {
        EXPECT_FALSE(log_.canUndo());
        EXPECT_FALSE(log_.canRedo());
        EXPECT_FALSE(log_.undoDescription().has_value());

        const auto undone = log_.undo();
        ASSERT_FALSE(undone.has_value());
        EXPECT_EQ(undone.error().type, SharedData::UndoErrorType::NothingToUndo);

        const auto redone = log_.redo();
        ASSERT_FALSE(redone.has_value());
        EXPECT_EQ(redone.error().type, SharedData::UndoErrorType::NothingToRedo);
    }

    TEST_F(UndoLogTests, DefaultBoundIsFifty)
    {
        EXPECT_EQ(log_.maxHistory(), 50u);
    }

    TEST_F(UndoLogTests, HistoryDropsOldestEntriesBeyondBound)
    {
        for (std::uint64_t i = 1; i <= 60; ++i)
            log_.push(copyOf(i, root() / "nothing"));

        ASSERT_EQ(log_.undoStack().size(), 50u);
        EXPECT_EQ(log_.undoStack().front().operationId.value(), 11u);
        EXPECT_EQ(log_.undoStack().back().operationId.value(), 60u);
    }

    TEST_F(UndoLogTests, SmallBoundIsHonored)
    {
        UndoLog log{2};
        log.push(copyOf(1, root() / "x"));
        log.push(copyOf(2, root() / "x"));
        log.push(copyOf(3, root() / "x"));
        ASSERT_EQ(log.undoStack().size(), 2u);
        EXPECT_EQ(log.undoStack().front().operationId.value(), 2u);
    }

    TEST_F(UndoLogTests, UndoOfCopyRemovesTheCopies)
    {
        const auto file = writeFile(root() / "copy.txt", "x");
        const auto directory = makeDirectory(root() / "copied_dir");
        writeFile(directory / "inner.txt", "y");
        log_.push(SharedData::UndoableOperation::copy(id_, {file, directory, root() / "already_gone"}));

        ASSERT_TRUE(log_.undo().has_value());
        EXPECT_FALSE(std::filesystem::exists(file));
        EXPECT_FALSE(std::filesystem::exists(directory));
        EXPECT_FALSE(log_.canUndo());
        EXPECT_TRUE(log_.canRedo());
    }

    TEST_F(UndoLogTests, CopyCannotBeRedone)
    {
        log_.push(copyOf(1, root() / "copy.txt"));
        ASSERT_TRUE(log_.undo().has_value());

        const auto redone = log_.redo();
        ASSERT_FALSE(redone.has_value());
        EXPECT_EQ(redone.error().type, SharedData::UndoErrorType::OperationNotReversible);
        EXPECT_EQ(redone.error().detail, "Copy operations cannot be redone after undo");
        EXPECT_FALSE(log_.canRedo());
        EXPECT_FALSE(log_.canUndo());
    }

    TEST_F(UndoLogTests, PushInvalidatesRedo)
    {
        log_.push(copyOf(1, root() / "a"));
        ASSERT_TRUE(log_.undo().has_value());
        ASSERT_TRUE(log_.canRedo());

        log_.push(copyOf(2, root() / "b"));
        EXPECT_FALSE(log_.canRedo());
        EXPECT_EQ(log_.undoStack().size(), 1u);
    }

    TEST_F(UndoLogTests, MoveCanBeUndoneAndRedone)
    {
        const auto original = writeFile(root() / "from" / "a.txt", "content");
        const auto moved = makeDirectory(root() / "to") / "a.txt";
        std::filesystem::rename(original, moved);
        log_.push(SharedData::UndoableOperation::move(id_, {original}, {moved}));

        EXPECT_EQ(log_.undoDescription(), "Move \"a.txt\"");
        ASSERT_TRUE(log_.undo().has_value());
        EXPECT_EQ(readFile(original), "content");
        EXPECT_FALSE(std::filesystem::exists(moved));
        EXPECT_EQ(log_.redoDescription(), "Move \"a.txt\"");

        ASSERT_TRUE(log_.redo().has_value());
        EXPECT_EQ(readFile(moved), "content");
        EXPECT_FALSE(std::filesystem::exists(original));
        EXPECT_TRUE(log_.canUndo());
        EXPECT_FALSE(log_.canRedo());
    }

    TEST_F(UndoLogTests, UndoRecreatesMissingParentDirectories)
    {
        const auto original = root() / "vanished_dir" / "a.txt";
        const auto moved = writeFile(root() / "to" / "a.txt", "content");
        log_.push(SharedData::UndoableOperation::move(id_, {original}, {moved}));

        ASSERT_TRUE(log_.undo().has_value());
        EXPECT_EQ(readFile(original), "content");
    }

    TEST_F(UndoLogTests, UndoOfVanishedMoveFailsAndConsumesTheEntry)
    {
        log_.push(SharedData::UndoableOperation::move(id_, {root() / "a.txt"}, {root() / "to" / "a.txt"}));

        const auto undone = log_.undo();
        ASSERT_FALSE(undone.has_value());
        EXPECT_EQ(undone.error().type, SharedData::UndoErrorType::OperationNotReversible);
        EXPECT_FALSE(log_.canUndo());
        EXPECT_FALSE(log_.canRedo());
    }

    TEST_F(UndoLogTests, RenameIsReversible)
    {
        const auto renamed = writeFile(root() / "new.txt", "content");
        const auto original = root() / "old.txt";
        log_.push(SharedData::UndoableOperation::rename(id_, original, renamed));

        EXPECT_EQ(log_.undoDescription(), "Rename \"old.txt\" to \"new.txt\"");
        ASSERT_TRUE(log_.undo().has_value());
        EXPECT_TRUE(std::filesystem::exists(original));
        EXPECT_FALSE(std::filesystem::exists(renamed));
    }

    TEST_F(UndoLogTests, DeleteIsRestoredFromTrash)
    {
        const auto trashed = writeFile(root() / "trash" / "a.txt", "content");
        const auto original = root() / "home" / "a.txt";
        log_.push(SharedData::UndoableOperation::remove(id_, {original}, {trashed}));

        ASSERT_TRUE(log_.undo().has_value());
        EXPECT_EQ(readFile(original), "content");

        ASSERT_TRUE(log_.redo().has_value());
        EXPECT_EQ(readFile(trashed), "content");
        EXPECT_FALSE(std::filesystem::exists(original));
    }

    TEST_F(UndoLogTests, ClearForgetsEverything)
    {
        log_.push(copyOf(1, root() / "a"));
        log_.push(copyOf(2, root() / "b"));
        ASSERT_TRUE(log_.undo().has_value());

        log_.clear();
        EXPECT_FALSE(log_.canUndo());
        EXPECT_FALSE(log_.canRedo());
    }
}
