#ifndef ARGBIND_CONTEXT_HPP
#define ARGBIND_CONTEXT_HPP

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <utility>
#include <vector>

namespace argbind {

// Copyable cancellation handle. Copies share state; cancelling a context also cancels every context
// derived from it with withCancel().
class Context {
public:
    using CancelFunc = std::function<void()>;

    // Root context, never cancelled.
    static Context background();

    // Child of `parent` and the function that cancels it. Safe to call the function more than once.
    static std::pair<Context, CancelFunc> withCancel(const Context& parent);

    [[nodiscard]] bool done() const;
    void wait() const;
    // True if the context was cancelled within `timeout`.
    [[nodiscard]] bool waitFor(std::chrono::milliseconds timeout) const;

    friend bool operator==(const Context& a, const Context& b) { return a.state_ == b.state_; }
    friend bool operator!=(const Context& a, const Context& b) { return !(a == b); }

private:
    struct State;

    explicit Context(std::shared_ptr<State> state) : state_(std::move(state)) {}

    static void cancel(const std::shared_ptr<State>& state);

    std::shared_ptr<State> state_;
};

// Returns a child of `ctx` cancelled on the first receipt of any of `signals`. With no signals, returns
// `ctx` itself. Signals reach one process-wide dispatcher thread, started on first use, through a
// self-pipe that stays open for the life of the process. A registration is dropped once it fires or
// once its context ends some other way.
// Throws std::invalid_argument for signal numbers outside 1..63 and std::system_error if the pipe,
// thread or handler cannot be set up.
Context cancelOnSignal(const Context& ctx, const std::vector<int>& signals);

namespace detail {

// Registrations still waiting for a signal.
std::size_t signalListenerCount();

} // namespace detail

} // namespace argbind

#endif // ARGBIND_CONTEXT_HPP
