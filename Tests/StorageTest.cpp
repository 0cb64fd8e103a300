/** @copyright Copyright (C) 2025 Pawel Maslanka (pawmas@hotmail.com)
 *  @license The GNU General Public License v3.0
 */
#include "FileStorage.hpp"
#include "StreamStorage.hpp"

#include <gtest/gtest.h>

#include <filesystem>

using namespace Storage;

namespace {
String fLoadAsString(IDataStorage& storage) {
    auto data = storage.LoadData();
    EXPECT_TRUE(data.has_value()) << storage.URI();
    return data.has_value() ? fToString(data.value()) : String();
}
} // namespace

class StreamStorageTest : public ::testing::Test {
protected:
    SharedPtr<ModuleRegistry> mModuleRegistry = std::make_shared<ModuleRegistry>();
};

TEST_F(StreamStorageTest, ReadsDocumentsSeparatedByBlankLine) {
    std::istringstream input("\n\n{\n  \"a\": 1\n}\n\n   \n[1, 2]\n");
    StreamStorage request("REQUEST", input, mModuleRegistry);
    StreamStorage response("RESPONSE", input, mModuleRegistry);

    EXPECT_EQ(fLoadAsString(request), "{\n  \"a\": 1\n}");
    EXPECT_EQ(fLoadAsString(response), "[1, 2]");
    EXPECT_EQ(request.URI(), "REQUEST");
}

TEST_F(StreamStorageTest, EndOfInputEndsDocument) {
    std::istringstream input("{\"a\": 1}");
    StreamStorage request("REQUEST", input, mModuleRegistry);
    StreamStorage response("RESPONSE", input, mModuleRegistry);

    EXPECT_EQ(fLoadAsString(request), "{\"a\": 1}");
    EXPECT_EQ(fLoadAsString(response), "");
}

TEST_F(StreamStorageTest, CannotBeWritten) {
    std::istringstream input;
    StreamStorage storage("REQUEST", input, mModuleRegistry);
    EXPECT_FALSE(storage.SaveData(fToByteStream("{}")));
}

class FileStorageTest : public ::testing::Test {
protected:
    void SetUp() override {
        mDirectory = std::filesystem::temp_directory_path() / ("json_comparator_" + std::to_string(::testing::UnitTest::GetInstance()->random_seed()) + "_" + ::testing::UnitTest::GetInstance()->current_test_info()->name());
        std::filesystem::create_directories(mDirectory);
    }

    void TearDown() override {
        std::error_code errCode;
        std::filesystem::remove_all(mDirectory, errCode);
    }

    std::filesystem::path mDirectory;
    SharedPtr<ModuleRegistry> mModuleRegistry = std::make_shared<ModuleRegistry>();
};

TEST_F(FileStorageTest, SavesAndLoadsData) {
    const auto fileName = (mDirectory / "report.txt").string();
    FileStorage storage(fileName, mModuleRegistry);
    ASSERT_TRUE(storage.SaveData(fToByteStream("line 1\nline 2\n")));
    EXPECT_TRUE(std::filesystem::exists(fileName));
    EXPECT_FALSE(std::filesystem::exists(fileName + ".tmp"));
    EXPECT_EQ(fLoadAsString(storage), "line 1\nline 2\n");
}

TEST_F(FileStorageTest, SaveOverwritesExistingFile) {
    const auto fileName = (mDirectory / "report.txt").string();
    FileStorage storage(fileName, mModuleRegistry);
    ASSERT_TRUE(storage.SaveData(fToByteStream("first version, longer")));
    ASSERT_TRUE(storage.SaveData(fToByteStream("second")));
    EXPECT_EQ(fLoadAsString(storage), "second");
}

TEST_F(FileStorageTest, MissingFileIsNotLoaded) {
    FileStorage storage((mDirectory / "missing.json").string(), mModuleRegistry);
    EXPECT_FALSE(storage.LoadData().has_value());
}

TEST_F(FileStorageTest, SaveIntoMissingDirectoryFails) {
    FileStorage storage((mDirectory / "no" / "such" / "dir" / "report.txt").string(), mModuleRegistry);
    EXPECT_FALSE(storage.SaveData(fToByteStream("data")));
}
