#include <iostream>
#include <string>
#include <vector>

#include "argbind/argbind.hpp"

struct PrintCmd {
    std::string message{"Hello, World!"};
    int times{1};
    bool help{false};
    std::vector<std::string> args;

    static void describe(argbind::Schema<PrintCmd>& s) {
        s.field("Message", &PrintCmd::message).flag("m,message");
        s.field("Times", &PrintCmd::times).flag("n,times");
        s.field("Help", &PrintCmd::help).flag("h,help");
    }

    void setArgs(std::vector<std::string> a) { args = std::move(a); }

    std::optional<std::string> validate() {
        if (times < 1) return std::string("times must be positive");
        return std::nullopt;
    }
};

int main(int argc, char** argv) {
    PrintCmd cmd;
    if (auto err = argbind::Parser().parse(argc, argv, &cmd)) {
        std::cerr << "error: " << *err << "\n";
        return static_cast<int>(argbind::ExitCode::InvalidArgs);
    }
    if (cmd.help) {
        std::cout << "usage: basic_example [-m MESSAGE] [-n TIMES] [ARGS...]\n";
        return 0;
    }

    for (int i = 0; i < cmd.times; ++i) std::cout << cmd.message << "\n";
    for (const auto& a : cmd.args) std::cout << "arg: " << a << "\n";
    return 0;
}
