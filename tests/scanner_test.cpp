#include "argbind/scanner.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <vector>

using namespace argbind;

namespace {

class ScannerTest : public ::testing::Test {
protected:
    void SetUp() override {
        flags_.define("i", std::make_shared<FieldSetter<int>>(i_));
        flags_.define("b", std::make_shared<FieldSetter<bool>>(b_));
    }

    std::optional<Error> scan(const std::vector<std::string>& args) { return scanArguments(flags_, args, positionals_); }

    int i_{0};
    bool b_{false};
    FlagSet flags_;
    std::vector<std::string> positionals_;
};

} // namespace

TEST_F(ScannerTest, Empty) {
    EXPECT_FALSE(scan({}));
    EXPECT_TRUE(positionals_.empty());
}

TEST_F(ScannerTest, FlagsOnly) {
    EXPECT_FALSE(scan({"-i", "3", "-b"}));
    EXPECT_EQ(i_, 3);
    EXPECT_TRUE(b_);
    EXPECT_TRUE(positionals_.empty());
}

TEST_F(ScannerTest, Interleaved) {
    EXPECT_FALSE(scan({"arg1", "-i", "1", "arg2", "-b", "arg3"}));
    EXPECT_EQ(i_, 1);
    EXPECT_TRUE(b_);
    EXPECT_EQ(positionals_, (std::vector<std::string>{"arg1", "arg2", "arg3"}));
}

TEST_F(ScannerTest, TerminatorMakesRestPositional) {
    EXPECT_FALSE(scan({"arg1", "--", "-i", "2", "--", "-z"}));
    EXPECT_EQ(i_, 0);
    EXPECT_EQ(positionals_, (std::vector<std::string>{"arg1", "-i", "2", "--", "-z"}));
}

TEST_F(ScannerTest, LeadingTerminator) {
    EXPECT_FALSE(scan({"--", "-i", "2"}));
    EXPECT_EQ(i_, 0);
    EXPECT_EQ(positionals_, (std::vector<std::string>{"-i", "2"}));
}

TEST_F(ScannerTest, TerminatorAfterFlags) {
    EXPECT_FALSE(scan({"-b", "--", "-b"}));
    EXPECT_TRUE(b_);
    EXPECT_EQ(positionals_, (std::vector<std::string>{"-b"}));
}

TEST_F(ScannerTest, DashTokensThatAreNotFlags) {
    EXPECT_FALSE(scan({"-", "---x", "-i", "4", "---"}));
    EXPECT_EQ(i_, 4);
    EXPECT_EQ(positionals_, (std::vector<std::string>{"-", "---x", "---"}));
}

TEST_F(ScannerTest, ErrorAfterPositional) {
    const auto err = scan({"arg1", "-z", "arg2"});
    ASSERT_TRUE(err);
    EXPECT_EQ(err->kind(), ErrorKind::UnknownFlag);
    EXPECT_NE(err->message().find("not defined: -z"), std::string::npos);
}
