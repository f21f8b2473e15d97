#pragma once

#include <functional>
#include <memory>
#include <thread>
#include <vector>

#include "shardsim/core/errors.hpp"

namespace shardsim::core {

// Runs each spawned task on its own thread. wait() joins every task and
// returns the status of the first failing task in spawn order.
class TaskGroup {
public:
    using Task = std::function<Status()>;

    TaskGroup() noexcept = default;
    ~TaskGroup() noexcept;

    TaskGroup(const TaskGroup&) = delete;
    TaskGroup& operator=(const TaskGroup&) = delete;

    // If no thread can be started the task runs inline on the caller.
    void spawn(Task task) noexcept;

    [[nodiscard]] Status wait() noexcept;

    // Number of failed tasks seen by the last wait().
    [[nodiscard]] u32 failed() const noexcept { return failed_; }

private:
    struct Slot {
        Task task;
        Status result{};
    };

    std::vector<std::unique_ptr<Slot>> slots_;
    std::vector<std::thread> threads_;
    u32 failed_{0};
};

} // namespace shardsim::core
