#include "argbind/mainer.hpp"

#include <filesystem>
#include <iostream>

namespace argbind {

Stdio currentStdio() {
    Stdio stdio;
    stdio.cwd = std::filesystem::current_path().string();
    stdio.in = &std::cin;
    stdio.out = &std::cout;
    stdio.err = &std::cerr;
    return stdio;
}

} // namespace argbind
