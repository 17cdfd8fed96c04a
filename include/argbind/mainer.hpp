#ifndef ARGBIND_MAINER_HPP
#define ARGBIND_MAINER_HPP

#include <iosfwd>
#include <string>
#include <vector>

namespace argbind {

// Process exit code returned by command entrypoints.
enum class ExitCode : int {
    Success = 0,
    Failure = 1,
    InvalidArgs = 2,
};

// Working directory and standard streams of a command. The parser never touches these; they are passed
// through to command code for its own reporting.
struct Stdio {
    std::string cwd;
    std::istream* in{nullptr};
    std::ostream* out{nullptr};
    std::ostream* err{nullptr};
};

// Stdio of the current process (std::cin/std::cout/std::cerr). `cwd` is read at call time; throws
// std::filesystem::filesystem_error if it cannot be determined.
Stdio currentStdio();

// Implemented by command types that provide a main entrypoint:
//
//   int main(int argc, char** argv) {
//       Cmd c;
//       return static_cast<int>(c.main({argv, argv + argc}, argbind::currentStdio()));
//   }
class Mainer {
public:
    virtual ~Mainer() = default;

    virtual ExitCode main(const std::vector<std::string>& args, const Stdio& stdio) = 0;
};

} // namespace argbind

#endif // ARGBIND_MAINER_HPP
