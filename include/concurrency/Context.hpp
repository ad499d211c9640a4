#pragma once

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace fileops::concurrency {

struct Cancelled : std::runtime_error {
    explicit Cancelled(const std::string& what = "operation cancelled") : std::runtime_error(what) {}
};

struct DeadlineExceeded : Cancelled {
    explicit DeadlineExceeded(const std::string& what = "deadline exceeded") : Cancelled(what) {}
};

// Cancellation scope shared between a caller and the work it starts. Cancelling a
// context cancels every context derived from it; a derived context never outlives
// its parent's deadline.
class Context : public std::enable_shared_from_this<Context> {
public:
    using Clock = std::chrono::steady_clock;

    enum class Reason { None, Cancelled, DeadlineExceeded };

    static std::shared_ptr<Context> background();
    static std::shared_ptr<Context> withCancel(const std::shared_ptr<Context>& parent);
    static std::shared_ptr<Context> withDeadline(const std::shared_ptr<Context>& parent, Clock::time_point deadline);
    static std::shared_ptr<Context> withTimeout(const std::shared_ptr<Context>& parent, Clock::duration timeout);

    void cancel();

    [[nodiscard]] bool done() const;
    [[nodiscard]] Reason reason() const;
    [[nodiscard]] std::optional<Clock::time_point> deadline() const { return deadline_; }

    // Throws Cancelled or DeadlineExceeded once the context is done.
    void throwIfDone() const;

    // Blocks for at most d; returns true if the context is done on return.
    bool waitFor(Clock::duration d) const;

    Context(const Context&) = delete;
    Context& operator=(const Context&) = delete;

private:
    struct Token {};

public:
    Context(Token, std::optional<Clock::time_point> deadline);

private:
    static std::shared_ptr<Context> derive(const std::shared_ptr<Context>& parent,
                                           std::optional<Clock::time_point> deadline);

    void cancelWith(Reason r);
    [[nodiscard]] Reason reasonLocked() const;

    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    Reason reason_ = Reason::None;
    const std::optional<Clock::time_point> deadline_;
    std::vector<std::weak_ptr<Context>> children_;
};

std::string to_string(Context::Reason r);

}
