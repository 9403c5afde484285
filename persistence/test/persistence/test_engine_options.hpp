#pragma once

#include <persistence/engine_options.hpp>
#include <utility/temporary_directory.hpp>

#include <gtest/gtest.h>

#include <fstream>
#include <string>

using namespace std::chrono_literals;

extern std::filesystem::path programDirectory;

namespace Persistence::Test
{
    class EngineOptionsTests : public ::testing::Test
    {
      protected:
        void writeFile(std::filesystem::path const& path, std::string const& content)
        {
            std::ofstream writer{path, std::ios_base::binary};
            writer << content;
        }

        Utility::TemporaryDirectory isolateDirectory_{programDirectory / "temp", true};
    };

    TEST_F(EngineOptionsTests, DefaultsAreFullyPopulated)
    {
        const auto options = EngineOptions::defaults();
        EXPECT_EQ(options.chunkSize, 64u * 1024u);
        EXPECT_EQ(options.maxUndoHistory, 50u);
        EXPECT_EQ(options.interactiveErrors, true);
        EXPECT_EQ(options.defaultErrorAction, SharedData::ErrorAction::Skip);
        EXPECT_EQ(options.errorResponseTimeout, 300s);
        EXPECT_EQ(options.completedRetention, 60s);
        EXPECT_EQ(options.recordUndoHistory, true);
        EXPECT_EQ(options.logLevel, Log::Level::Info);
        EXPECT_FALSE(options.logFile.has_value());
    }

    TEST_F(EngineOptionsTests, UseDefaultsFromKeepsSetFields)
    {
        EngineOptions options{.chunkSize = 1024, .interactiveErrors = false};
        options.useDefaultsFrom(EngineOptions::defaults());
        EXPECT_EQ(options.chunkSize, 1024u);
        EXPECT_EQ(options.interactiveErrors, false);
        EXPECT_EQ(options.maxUndoHistory, 50u);
    }

    TEST_F(EngineOptionsTests, MissingFileYieldsDefaults)
    {
        const auto options = loadEngineOptions(isolateDirectory_.path() / "nope.json");
        ASSERT_TRUE(options.has_value());
        EXPECT_EQ(options->chunkSize, 64u * 1024u);
    }

    TEST_F(EngineOptionsTests, PartialFileIsMergedWithDefaults)
    {
        const auto path = isolateDirectory_.path() / "options.json";
        writeFile(path, R"({"chunkSize": 4096, "defaultErrorAction": "Cancel", "errorResponseTimeout": 1.5})");

        const auto options = loadEngineOptions(path);
        ASSERT_TRUE(options.has_value()) << options.error();
        EXPECT_EQ(options->chunkSize, 4096u);
        EXPECT_EQ(options->defaultErrorAction, SharedData::ErrorAction::Cancel);
        EXPECT_EQ(options->errorResponseTimeout, 1500ms);
        EXPECT_EQ(options->maxUndoHistory, 50u);
    }

    TEST_F(EngineOptionsTests, CommentsAreAllowed)
    {
        const auto path = isolateDirectory_.path() / "options.json";
        writeFile(path, "{\n// smaller chunks\n\"chunkSize\": 512\n}");

        const auto options = loadEngineOptions(path);
        ASSERT_TRUE(options.has_value()) << options.error();
        EXPECT_EQ(options->chunkSize, 512u);
    }

    TEST_F(EngineOptionsTests, MalformedFileIsAnError)
    {
        const auto path = isolateDirectory_.path() / "options.json";
        writeFile(path, "{ chunkSize: ");
        EXPECT_FALSE(loadEngineOptions(path).has_value());
    }

    TEST_F(EngineOptionsTests, UnknownEnumValueIsAnError)
    {
        const auto path = isolateDirectory_.path() / "options.json";
        writeFile(path, R"({"defaultErrorAction": "Explode"})");
        EXPECT_FALSE(loadEngineOptions(path).has_value());
    }

    TEST_F(EngineOptionsTests, LogLevelNamesIgnoreCaseAndAcceptShortForms)
    {
        const auto path = isolateDirectory_.path() / "options.json";
        writeFile(path, R"({"logLevel": "WARN"})");
        auto options = loadEngineOptions(path);
        ASSERT_TRUE(options.has_value()) << options.error();
        EXPECT_EQ(options->logLevel, Log::Level::Warning);

        writeFile(path, R"({"logLevel": "Critical"})");
        options = loadEngineOptions(path);
        ASSERT_TRUE(options.has_value()) << options.error();
        EXPECT_EQ(options->logLevel, Log::Level::Critical);

        writeFile(path, R"({"logLevel": "off"})");
        options = loadEngineOptions(path);
        ASSERT_TRUE(options.has_value()) << options.error();
        EXPECT_EQ(options->logLevel, Log::Level::Off);
    }

    TEST_F(EngineOptionsTests, UnknownLogLevelIsAnError)
    {
        const auto path = isolateDirectory_.path() / "options.json";
        writeFile(path, R"({"logLevel": "loud"})");
        EXPECT_FALSE(loadEngineOptions(path).has_value());
    }

    TEST_F(EngineOptionsTests, ZeroChunkSizeIsRejected)
    {
        const auto path = isolateDirectory_.path() / "options.json";
        writeFile(path, R"({"chunkSize": 0})");
        EXPECT_FALSE(loadEngineOptions(path).has_value());
    }

    TEST_F(EngineOptionsTests, SavedOptionsLoadBackIdentically)
    {
        auto options = EngineOptions::defaults();
        options.chunkSize = 2048;
        options.interactiveErrors = false;
        options.defaultErrorAction = SharedData::ErrorAction::Retry;
        options.completedRetention = 2500ms;
        options.logLevel = Log::Level::Debug;
        options.logFile = isolateDirectory_.path() / "engine.log";

        const auto path = isolateDirectory_.path() / "nested" / "options.json";
        ASSERT_TRUE(saveEngineOptions(path, options).has_value());

        const auto loaded = loadEngineOptions(path);
        ASSERT_TRUE(loaded.has_value()) << loaded.error();
        EXPECT_EQ(loaded->chunkSize, 2048u);
        EXPECT_EQ(loaded->interactiveErrors, false);
        EXPECT_EQ(loaded->defaultErrorAction, SharedData::ErrorAction::Retry);
        EXPECT_EQ(loaded->completedRetention, 2500ms);
        EXPECT_EQ(loaded->logLevel, Log::Level::Debug);
        EXPECT_EQ(loaded->logFile, options.logFile);
    }

    TEST_F(EngineOptionsTests, UnsetFieldsAreNotWritten)
    {
        nlohmann::json j = EngineOptions{.maxUndoHistory = 10};
        EXPECT_EQ(j.size(), 1u);
        EXPECT_EQ(j["maxUndoHistory"], 10);
    }
}
