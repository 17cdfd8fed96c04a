#include <iostream>
#include <string>
#include <unordered_map>
#include <vector>

#include "argbind/argbind.hpp"

static std::string join(const std::vector<std::string>& v, const std::string& sep) {
    std::string out;
    for (std::size_t i = 0; i < v.size(); ++i) {
        if (i) out += sep;
        out += v[i];
    }
    return out;
}

struct Opts {
    std::vector<std::string> tags;
    bool verbose{false};
    std::unordered_map<std::string, int> counts;

    static void describe(argbind::Schema<Opts>& s) {
        s.field("Tags", &Opts::tags).flag("t,tag");
        s.field("Verbose", &Opts::verbose).flag("v,verbose");
    }

    void setFlagsCount(std::unordered_map<std::string, int> c) { counts = std::move(c); }
};

int main(int argc, char** argv) {
    Opts opts;
    if (auto err = argbind::Parser().parse(argc, argv, &opts)) {
        std::cerr << "error: " << *err << "\n";
        return static_cast<int>(argbind::ExitCode::InvalidArgs);
    }

    std::cout << "tags=" << join(opts.tags, "|") << "\n";
    // -v -v -v raises the level, the bool itself only records presence.
    std::cout << "verbosity=" << (opts.counts.count("v") ? opts.counts.at("v") : 0) << "\n";
    return 0;
}
