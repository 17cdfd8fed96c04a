#include "argbind/flagset.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

using namespace argbind;

namespace {

struct Fixture {
    std::string s;
    bool b{false};
    int i{0};
    std::vector<std::string> list;
    FlagSet flags;

    Fixture() {
        auto str = std::make_shared<FieldSetter<std::string>>(s);
        flags.define("s", str);
        flags.define("string", str);
        flags.define("b", std::make_shared<FieldSetter<bool>>(b));
        flags.define("i", std::make_shared<FieldSetter<int>>(i));
        flags.define("l", std::make_shared<AppendSetter<std::vector<std::string>>>(list));
    }

    std::optional<Error> run(const std::vector<std::string>& args, std::size_t& pos) { return flags.parseRun(args, pos); }
};

} // namespace

TEST(FlagTokenTest, Syntax) {
    EXPECT_TRUE(FlagSet::isFlagToken("-a"));
    EXPECT_TRUE(FlagSet::isFlagToken("--a"));
    EXPECT_TRUE(FlagSet::isFlagToken("-name=value"));
    EXPECT_FALSE(FlagSet::isFlagToken("-"));
    EXPECT_FALSE(FlagSet::isFlagToken("--"));
    EXPECT_FALSE(FlagSet::isFlagToken("---a"));
    EXPECT_FALSE(FlagSet::isFlagToken("a"));
    EXPECT_FALSE(FlagSet::isFlagToken(""));
}

TEST(FlagSetTest, DefineTwiceThrows) {
    FlagSet fs;
    bool b = false;
    fs.define("x", std::make_shared<FieldSetter<bool>>(b));
    try {
        fs.define("x", std::make_shared<FieldSetter<bool>>(b));
        FAIL() << "expected ConfigError";
    } catch (const ConfigError& e) {
        EXPECT_STREQ(e.what(), "flag redefined: x");
    }
}

TEST(FlagSetTest, RunStopsAtPositional) {
    Fixture f;
    const std::vector<std::string> args{"-s", "a", "-b", "pos", "-i", "2"};
    std::size_t pos = 0;
    EXPECT_FALSE(f.run(args, pos));
    EXPECT_EQ(pos, 3u);
    EXPECT_EQ(f.s, "a");
    EXPECT_TRUE(f.b);
    EXPECT_EQ(f.i, 0);
}

TEST(FlagSetTest, RunLeavesTerminator) {
    Fixture f;
    const std::vector<std::string> args{"-b", "--", "-i", "2"};
    std::size_t pos = 0;
    EXPECT_FALSE(f.run(args, pos));
    EXPECT_EQ(pos, 1u);
    EXPECT_EQ(f.i, 0);
}

TEST(FlagSetTest, EqualsForms) {
    Fixture f;
    const std::vector<std::string> args{"--string=x=y", "-i=5", "-b=false"};
    std::size_t pos = 0;
    f.b = true;
    EXPECT_FALSE(f.run(args, pos));
    EXPECT_EQ(pos, args.size());
    EXPECT_EQ(f.s, "x=y");
    EXPECT_EQ(f.i, 5);
    EXPECT_FALSE(f.b);
}

TEST(FlagSetTest, BoolDoesNotConsumeNext) {
    Fixture f;
    const std::vector<std::string> args{"-b", "false"};
    std::size_t pos = 0;
    EXPECT_FALSE(f.run(args, pos));
    EXPECT_TRUE(f.b);
    EXPECT_EQ(pos, 1u);
}

TEST(FlagSetTest, ValueMayLookLikeFlag) {
    Fixture f;
    const std::vector<std::string> args{"-s", "-b"};
    std::size_t pos = 0;
    EXPECT_FALSE(f.run(args, pos));
    EXPECT_EQ(f.s, "-b");
    EXPECT_FALSE(f.b);
}

TEST(FlagSetTest, RepeatedFlags) {
    Fixture f;
    const std::vector<std::string> args{"-s", "a", "--string", "b", "-l", "1", "-l", "2"};
    std::size_t pos = 0;
    EXPECT_FALSE(f.run(args, pos));
    EXPECT_EQ(f.s, "b");
    EXPECT_EQ(f.list, (std::vector<std::string>{"1", "2"}));
    EXPECT_EQ(f.flags.actual(), (std::vector<std::string>{"s", "string", "l"}));
}

TEST(FlagSetTest, UnknownFlag) {
    Fixture f;
    const std::vector<std::string> args{"--zz", "1"};
    std::size_t pos = 0;
    const auto err = f.run(args, pos);
    ASSERT_TRUE(err);
    EXPECT_EQ(err->kind(), ErrorKind::UnknownFlag);
    EXPECT_EQ(err->message(), "flag provided but not defined: -zz");
}

TEST(FlagSetTest, HelpIsNotBuiltIn) {
    Fixture f;
    std::size_t pos = 0;
    auto err = f.run({"-help"}, pos);
    ASSERT_TRUE(err);
    EXPECT_EQ(err->message(), "flag provided but not defined: -help");

    pos = 0;
    err = f.run({"-h"}, pos);
    ASSERT_TRUE(err);
    EXPECT_EQ(err->message(), "flag provided but not defined: -h");
}

TEST(FlagSetTest, BadSyntax) {
    Fixture f;
    std::size_t pos = 0;
    const auto err = f.run({"-=x"}, pos);
    ASSERT_TRUE(err);
    EXPECT_EQ(err->kind(), ErrorKind::Syntax);
    EXPECT_EQ(err->message(), "bad flag syntax: -=x");
}

TEST(FlagSetTest, MissingArgument) {
    Fixture f;
    std::size_t pos = 0;
    const auto err = f.run({"-b", "-i"}, pos);
    ASSERT_TRUE(err);
    EXPECT_EQ(err->kind(), ErrorKind::MissingValue);
    EXPECT_EQ(err->message(), "flag needs an argument: -i");
}

TEST(FlagSetTest, CoercionErrors) {
    Fixture f;
    std::size_t pos = 0;
    auto err = f.run({"-i", "ten"}, pos);
    ASSERT_TRUE(err);
    EXPECT_EQ(err->kind(), ErrorKind::Coercion);
    EXPECT_EQ(err->message(), "invalid value \"ten\" for flag -i: invalid syntax");

    pos = 0;
    err = f.run({"-b=maybe"}, pos);
    ASSERT_TRUE(err);
    EXPECT_EQ(err->kind(), ErrorKind::Coercion);
    EXPECT_EQ(err->message(), "invalid boolean value \"maybe\" for -b: invalid syntax");
}

TEST(FlagSetTest, CountingDecorator) {
    Fixture f;
    std::unordered_map<std::string, int> counts;
    const std::unordered_map<std::string, std::string> canonical{
        {"s", "s"}, {"string", "s"}, {"b", "b"}, {"i", "i"}, {"l", "l"}};
    f.flags.decorate([&](const std::string& name, std::shared_ptr<Setter> inner) -> std::shared_ptr<Setter> {
        return std::make_shared<CountingSetter>(std::move(inner), canonical.at(name), counts);
    });

    std::size_t pos = 0;
    EXPECT_FALSE(f.run({"-s", "a", "--string", "b", "-b", "-b"}, pos));
    EXPECT_EQ(counts.at("s"), 2);
    EXPECT_EQ(counts.at("b"), 2);
    EXPECT_EQ(counts.count("i"), 0u);
    EXPECT_TRUE(f.flags.lookup("b")->isBoolFlag());
    EXPECT_EQ(f.s, "b");
}
