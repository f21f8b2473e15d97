#include "shardsim/core/task_group.hpp"

#include <system_error>
#include <utility>

namespace shardsim::core {

TaskGroup::~TaskGroup() noexcept {
    for (std::thread& t : threads_) {
        if (t.joinable()) {
            t.join();
        }
    }
}

void TaskGroup::spawn(Task task) noexcept {
    slots_.push_back(std::make_unique<Slot>());
    Slot* slot = slots_.back().get();
    slot->task = std::move(task);

    try {
        threads_.emplace_back([slot]() { slot->result = slot->task(); });
    } catch (const std::system_error&) {
        slot->result = slot->task();
    }
}

Status TaskGroup::wait() noexcept {
    for (std::thread& t : threads_) {
        if (t.joinable()) {
            t.join();
        }
    }
    threads_.clear();

    Status first = ok_status();
    failed_ = 0;
    for (const auto& slot : slots_) {
        if (!is_ok(slot->result)) {
            if (failed_ == 0) {
                first = slot->result;
            }
            ++failed_;
        }
    }
    slots_.clear();
    return first;
}

} // namespace shardsim::core
