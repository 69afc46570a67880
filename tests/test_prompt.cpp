#include <gtest/gtest.h>

#include "dirtree/logger.hpp"
#include "dirtree/prompt.hpp"

#include "temp_dir.hpp"

#include <sstream>

using namespace dirtree;

namespace {

class PromptTest : public test::TempDirTest {
protected:
    void SetUp() override {
        TempDirTest::SetUp();
        Logger::instance().set_output(nullptr);
    }

    void TearDown() override {
        Logger::instance().set_output(&std::clog);
        TempDirTest::TearDown();
    }

    static std::size_t count(const std::string& text, std::string_view needle) {
        std::size_t n = 0;
        for (auto pos = text.find(needle); pos != std::string::npos; pos = text.find(needle, pos + needle.size())) {
            ++n;
        }
        return n;
    }
};

} // namespace

TEST_F(PromptTest, AcceptsExistingDirectory) {
    std::istringstream in(root_.string() + "\n");
    std::ostringstream out;
    auto result = DirectoryPrompt(in, out).ask();
    ASSERT_TRUE(result);
    EXPECT_EQ(*result, root_);
    EXPECT_EQ(count(out.str(), "Enter the directory to scan"), 1u);
}

TEST_F(PromptTest, TrimsSurroundingWhitespace) {
    std::istringstream in("   " + root_.string() + " \t\n");
    std::ostringstream out;
    auto result = DirectoryPrompt(in, out).ask();
    ASSERT_TRUE(result);
    EXPECT_EQ(*result, root_);
}

TEST_F(PromptTest, EmptyInputUsesCurrentDirectory) {
    std::istringstream in("\n");
    std::ostringstream out;
    auto result = DirectoryPrompt(in, out).ask();
    ASSERT_TRUE(result);
    EXPECT_EQ(*result, std::filesystem::current_path());
    EXPECT_NE(out.str().find("Using current directory: " + std::filesystem::current_path().string()),
        std::string::npos);
}

TEST_F(PromptTest, RetriesUntilValid) {
    auto file = touch("plain.txt");
    std::istringstream in((root_ / "missing").string() + "\n" + file.string() + "\n" + root_.string() + "\n");
    std::ostringstream out;
    auto result = DirectoryPrompt(in, out).ask();
    ASSERT_TRUE(result);
    EXPECT_EQ(*result, root_);
    EXPECT_EQ(count(out.str(), "Invalid directory"), 2u);
    EXPECT_EQ(count(out.str(), "Enter the directory to scan"), 3u);
}

TEST_F(PromptTest, EndOfInputGivesUp) {
    std::istringstream in((root_ / "missing").string() + "\n");
    std::ostringstream out;
    auto result = DirectoryPrompt(in, out).ask();
    EXPECT_FALSE(result);
    EXPECT_EQ(count(out.str(), "Invalid directory"), 1u);
}

TEST_F(PromptTest, ValidDirectoryCheck) {
    EXPECT_TRUE(is_valid_directory(root_));
    EXPECT_FALSE(is_valid_directory(touch("f.txt")));
    EXPECT_FALSE(is_valid_directory(root_ / "nope"));
}
