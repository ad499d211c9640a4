#include "concurrency/Context.hpp"

#include <algorithm>

using namespace fileops::concurrency;

Context::Context(Token, std::optional<Clock::time_point> deadline) : deadline_(deadline) {}

std::shared_ptr<Context> Context::background() {
    return std::make_shared<Context>(Token{}, std::nullopt);
}

std::shared_ptr<Context> Context::withCancel(const std::shared_ptr<Context>& parent) {
    return derive(parent, std::nullopt);
}

std::shared_ptr<Context> Context::withDeadline(const std::shared_ptr<Context>& parent,
                                               const Clock::time_point deadline) {
    return derive(parent, deadline);
}

std::shared_ptr<Context> Context::withTimeout(const std::shared_ptr<Context>& parent,
                                              const Clock::duration timeout) {
    return derive(parent, Clock::now() + timeout);
}

std::shared_ptr<Context> Context::derive(const std::shared_ptr<Context>& parent,
                                         std::optional<Clock::time_point> deadline) {
    if (!parent) return std::make_shared<Context>(Token{}, deadline);

    if (parent->deadline_ && (!deadline || *parent->deadline_ < *deadline)) deadline = parent->deadline_;

    auto child = std::make_shared<Context>(Token{}, deadline);

    Reason inherited;
    {
        std::scoped_lock lock(parent->mutex_);
        inherited = parent->reason_;
        if (inherited == Reason::None) {
            std::erase_if(parent->children_, [](const auto& w) { return w.expired(); });
            parent->children_.push_back(child);
        }
    }

    if (inherited != Reason::None) child->cancelWith(inherited);
    return child;
}

void Context::cancel() { cancelWith(Reason::Cancelled); }

void Context::cancelWith(const Reason r) {
    std::vector<std::weak_ptr<Context>> children;
    {
        std::scoped_lock lock(mutex_);
        if (reason_ != Reason::None) return;
        reason_ = r;
        children.swap(children_);
    }
    cv_.notify_all();

    for (const auto& weak : children)
        if (const auto child = weak.lock()) child->cancelWith(r);
}

Context::Reason Context::reasonLocked() const {
    if (reason_ != Reason::None) return reason_;
    if (deadline_ && Clock::now() >= *deadline_) return Reason::DeadlineExceeded;
    return Reason::None;
}

bool Context::done() const { return reason() != Reason::None; }

Context::Reason Context::reason() const {
    std::scoped_lock lock(mutex_);
    return reasonLocked();
}

void Context::throwIfDone() const {
    switch (reason()) {
        case Reason::None: return;
        case Reason::DeadlineExceeded: throw DeadlineExceeded();
        case Reason::Cancelled: throw Cancelled();
    }
}

bool Context::waitFor(const Clock::duration d) const {
    auto until = Clock::now() + d;
    if (deadline_ && *deadline_ < until) until = *deadline_;

    std::unique_lock lock(mutex_);
    cv_.wait_until(lock, until, [this] { return reason_ != Reason::None; });
    return reasonLocked() != Reason::None;
}

std::string fileops::concurrency::to_string(const Context::Reason r) {
    switch (r) {
        case Context::Reason::None: return "none";
        case Context::Reason::Cancelled: return "cancelled";
        case Context::Reason::DeadlineExceeded: return "deadline exceeded";
    }
    return "unknown";
}
