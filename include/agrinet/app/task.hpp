#pragma once

#include "../core/constants.hpp"
#include "../core/types.hpp"
#include "../util/state_machine.hpp"
#include "process_data.hpp"
#include <datapod/datapod.hpp>

namespace agrinet::app {

    // ─── Task lifecycle ──────────────────────────────────────────────────────────
    // Requested -> Assigned -> Running <-> Suspended -> Completed
    // Aborted is reachable from every non-terminal state.
    enum class TaskState : u8 { Requested, Assigned, Running, Suspended, Completed, Aborted };

    inline const char *to_string(TaskState s) noexcept {
        switch (s) {
        case TaskState::Requested:
            return "Requested";
        case TaskState::Assigned:
            return "Assigned";
        case TaskState::Running:
            return "Running";
        case TaskState::Suspended:
            return "Suspended";
        case TaskState::Completed:
            return "Completed";
        case TaskState::Aborted:
            return "Aborted";
        }
        return "Aborted";
    }

    inline constexpr bool is_terminal(TaskState s) noexcept {
        return s == TaskState::Completed || s == TaskState::Aborted;
    }

    // States in which process data may be exchanged
    inline constexpr bool accepts_process_data(TaskState s) noexcept {
        return s == TaskState::Assigned || s == TaskState::Running || s == TaskState::Suspended;
    }

    inline bool task_transition_allowed(TaskState from, TaskState to) {
        if (is_terminal(from))
            return false;
        if (to == TaskState::Aborted)
            return true;
        switch (from) {
        case TaskState::Requested:
            return to == TaskState::Assigned;
        case TaskState::Assigned:
            return to == TaskState::Running;
        case TaskState::Running:
            return to == TaskState::Suspended || to == TaskState::Completed;
        case TaskState::Suspended:
            return to == TaskState::Running || to == TaskState::Completed;
        default:
            return false;
        }
    }

    // ─── Task ────────────────────────────────────────────────────────────────────
    struct Task {
        TaskId id = 0;
        Address implement = NULL_ADDRESS;
        dp::Vector<ProcessDataParameter> parameters;
        StateMachine<TaskState> machine{TaskState::Requested, task_transition_allowed};

        Task() = default;
        Task(TaskId task_id, Address implement_address, dp::Vector<ProcessDataParameter> params)
            : id(task_id), implement(implement_address), parameters(std::move(params)) {}

        TaskState state() const noexcept { return machine.state(); }
        bool terminal() const noexcept { return is_terminal(machine.state()); }

        ProcessDataParameter *find(DDI ddi) {
            for (auto &p : parameters) {
                if (p.ddi() == ddi)
                    return &p;
            }
            return nullptr;
        }

        const ProcessDataParameter *find(DDI ddi) const {
            for (const auto &p : parameters) {
                if (p.ddi() == ddi)
                    return &p;
            }
            return nullptr;
        }

        ProcessDataParameter *find(const dp::String &name) {
            for (auto &p : parameters) {
                if (p.definition.name == name)
                    return &p;
            }
            return nullptr;
        }

        const ProcessDataParameter *find(const dp::String &name) const {
            for (const auto &p : parameters) {
                if (p.definition.name == name)
                    return &p;
            }
            return nullptr;
        }
    };

} // namespace agrinet::app
