#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <vector>

#include "argbind/argbind.hpp"

// Waits until interrupted (Ctrl-C) or until -wait elapses.
class Sleeper final : public argbind::Mainer {
public:
    std::chrono::nanoseconds wait{std::chrono::seconds(10)};

    static void describe(argbind::Schema<Sleeper>& s) { s.field("Wait", &Sleeper::wait).flag("w,wait"); }

    argbind::ExitCode main(const std::vector<std::string>& args, const argbind::Stdio& stdio) override {
        if (auto err = argbind::Parser().parse(args, this)) {
            *stdio.err << "error: " << *err << "\n";
            return argbind::ExitCode::InvalidArgs;
        }

        const auto ctx = argbind::cancelOnSignal(argbind::Context::background(), {SIGINT, SIGTERM});
        *stdio.out << "waiting in " << stdio.cwd << "\n";
        if (ctx.waitFor(std::chrono::duration_cast<std::chrono::milliseconds>(wait))) {
            *stdio.out << "interrupted\n";
            return argbind::ExitCode::Failure;
        }
        *stdio.out << "done\n";
        return argbind::ExitCode::Success;
    }
};

int main(int argc, char** argv) {
    Sleeper s;
    return static_cast<int>(s.main({argv, argv + argc}, argbind::currentStdio()));
}
