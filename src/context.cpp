#include "argbind/context.hpp"

#include <algorithm>
#include <condition_variable>
#include <mutex>

namespace argbind {

struct Context::State {
    std::mutex mu;
    std::condition_variable cv;
    bool cancelled{false};
    std::vector<std::weak_ptr<State>> children;
};

Context Context::background() {
    static const auto root = std::make_shared<State>();
    return Context(root);
}

std::pair<Context, Context::CancelFunc> Context::withCancel(const Context& parent) {
    auto child = std::make_shared<State>();
    bool parentDone = false;
    {
        std::lock_guard<std::mutex> lock(parent.state_->mu);
        if (parent.state_->cancelled) {
            parentDone = true;
        } else {
            auto& kids = parent.state_->children;
            kids.erase(std::remove_if(kids.begin(), kids.end(), [](const auto& w) { return w.expired(); }), kids.end());
            kids.push_back(child);
        }
    }
    if (parentDone) cancel(child);
    return {Context(child), [child] { cancel(child); }};
}

bool Context::done() const {
    std::lock_guard<std::mutex> lock(state_->mu);
    return state_->cancelled;
}

void Context::wait() const {
    std::unique_lock<std::mutex> lock(state_->mu);
    state_->cv.wait(lock, [this] { return state_->cancelled; });
}

bool Context::waitFor(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(state_->mu);
    return state_->cv.wait_for(lock, timeout, [this] { return state_->cancelled; });
}

void Context::cancel(const std::shared_ptr<State>& state) {
    std::vector<std::shared_ptr<State>> kids;
    {
        std::lock_guard<std::mutex> lock(state->mu);
        if (state->cancelled) return;
        state->cancelled = true;
        for (const auto& w : state->children) {
            if (auto k = w.lock()) kids.push_back(std::move(k));
        }
        state->children.clear();
    }
    state->cv.notify_all();
    for (const auto& k : kids) cancel(k);
}

} // namespace argbind
