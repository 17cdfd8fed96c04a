#include "argbind/context.hpp"

#include <atomic>
#include <cerrno>
#include <cstdint>
#include <mutex>
#include <stdexcept>
#include <string>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>

#include <fcntl.h>
#include <signal.h>
#include <unistd.h>

namespace {

struct Listener {
    std::uint64_t mask;
    argbind::Context ctx;
    argbind::Context::CancelFunc cancel;
};

// Write end of the process-wide self-pipe. Set once and never closed, so the handler can always use it.
std::atomic<int> gWriteFd{-1};

// Guards everything below.
std::mutex gMu;
std::uint64_t gInstalled = 0;
std::vector<Listener> gListeners;

extern "C" void onSignal(int signo) {
    const int savedErrno = errno;
    const int fd = gWriteFd.load(std::memory_order_acquire);
    if (fd >= 0) {
        const auto b = static_cast<unsigned char>(signo);
        // Nonblocking: with a full pipe the dispatcher already has work queued.
        const ssize_t n = ::write(fd, &b, 1);
        (void)n;
    }
    errno = savedErrno;
}

// Drops listeners whose context already ended without a signal. Caller holds gMu.
void pruneLocked() {
    std::vector<Listener> keep;
    keep.reserve(gListeners.size());
    for (auto& l : gListeners) {
        if (!l.ctx.done()) keep.push_back(std::move(l));
    }
    gListeners.swap(keep);
}

void dispatch(int readFd) {
    for (;;) {
        unsigned char b = 0;
        const ssize_t n = ::read(readFd, &b, 1);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return;

        const std::uint64_t bit = std::uint64_t{1} << b;
        std::vector<argbind::Context::CancelFunc> fire;
        {
            std::lock_guard<std::mutex> lock(gMu);
            std::vector<Listener> keep;
            for (auto& l : gListeners) {
                if ((l.mask & bit) != 0) {
                    fire.push_back(std::move(l.cancel));
                } else if (!l.ctx.done()) {
                    keep.push_back(std::move(l));
                }
            }
            gListeners.swap(keep);
        }
        for (const auto& cancel : fire) cancel();
    }
}

// Creates the self-pipe and starts the dispatcher on first use. Caller holds gMu.
void ensureDispatcherLocked() {
    if (gWriteFd.load(std::memory_order_relaxed) >= 0) return;

    int fds[2];
    if (::pipe(fds) != 0) throw std::system_error(errno, std::generic_category(), "pipe");
    for (const int fd : fds) ::fcntl(fd, F_SETFD, FD_CLOEXEC);
    ::fcntl(fds[1], F_SETFL, ::fcntl(fds[1], F_GETFL) | O_NONBLOCK);

    try {
        std::thread(dispatch, fds[0]).detach();
    } catch (...) {
        ::close(fds[0]);
        ::close(fds[1]);
        throw;
    }
    gWriteFd.store(fds[1], std::memory_order_release);
}

void installHandlerLocked(int signo) {
    const std::uint64_t bit = std::uint64_t{1} << signo;
    if ((gInstalled & bit) != 0) return;

    struct sigaction sa {};
    sa.sa_handler = onSignal;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = SA_RESTART;
    if (::sigaction(signo, &sa, nullptr) != 0) {
        throw std::system_error(errno, std::generic_category(), "sigaction(" + std::to_string(signo) + ")");
    }
    gInstalled |= bit;
}

} // namespace

namespace argbind {

Context cancelOnSignal(const Context& ctx, const std::vector<int>& signals) {
    if (signals.empty()) return ctx;

    std::uint64_t mask = 0;
    for (const int signo : signals) {
        if (signo <= 0 || signo >= 64) throw std::invalid_argument("unsupported signal number: " + std::to_string(signo));
        mask |= std::uint64_t{1} << signo;
    }

    auto child = Context::withCancel(ctx);
    std::lock_guard<std::mutex> lock(gMu);
    ensureDispatcherLocked();
    for (const int signo : signals) installHandlerLocked(signo);
    pruneLocked();
    gListeners.push_back(Listener{mask, child.first, std::move(child.second)});
    return child.first;
}

namespace detail {

std::size_t signalListenerCount() {
    std::lock_guard<std::mutex> lock(gMu);
    pruneLocked();
    return gListeners.size();
}

} // namespace detail

} // namespace argbind
