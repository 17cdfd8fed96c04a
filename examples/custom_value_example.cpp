#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "argbind/argbind.hpp"

class LevelValue final : public argbind::Value {
public:
    std::string string() const override { return value_; }

    std::optional<std::string> set(std::string_view v) override {
        if (v == "debug" || v == "info" || v == "warn" || v == "error") {
            value_ = std::string(v);
            return std::nullopt;
        }
        return std::string("invalid level: ") + std::string(v);
    }

private:
    std::string value_{"info"};
};

struct Opts {
    LevelValue level;
    std::vector<std::unique_ptr<LevelValue>> also;

    static void describe(argbind::Schema<Opts>& s) {
        s.field("Level", &Opts::level).flag("l,level").env("LEVEL");
        s.field("Also", &Opts::also).flag("also");
    }
};

int main(int argc, char** argv) {
    argbind::Parser::Options options;
    options.envVars = true;

    Opts opts;
    if (auto err = argbind::Parser(options).parse(argc, argv, &opts)) {
        std::cerr << "error: " << *err << "\n";
        return static_cast<int>(argbind::ExitCode::InvalidArgs);
    }

    std::cout << opts.level.string() << "\n";
    for (const auto& l : opts.also) std::cout << "also " << l->string() << "\n";
    return 0;
}
