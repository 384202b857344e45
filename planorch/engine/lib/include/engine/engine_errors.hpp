/*
 * SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
 * SPDX-License-Identifier: Apache-2.0
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 * http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

/**
 * @file engine_errors.hpp
 * @brief Error codes for plan orchestration operations
 *
 * Provides type-safe error codes compatible with std::error_code for graph
 * building, status persistence, scheduling, commit queuing and the control
 * surface, plus the Result type used across the engine.
 */

#ifndef PLANORCH_ENGINE_ENGINE_ERRORS_HPP
#define PLANORCH_ENGINE_ENGINE_ERRORS_HPP

#include <array>
#include <cstdint>
#include <format>
#include <limits>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>

#include <tl/expected.hpp>
#include <wise_enum.h>

namespace planorch::engine {

/**
 * Orchestration error codes compatible with std::error_code
 */
// clang-format off
enum class OrchErrc : std::uint8_t {
    Success,           //!< Operation succeeded
    ValidationError,   //!< Plan structure invalid (duplicate, dangling or self reference)
    CycleError,        //!< Dependency graph contains a cycle
    PlanNotFound,      //!< No snapshot exists for the plan
    PlanExists,        //!< Snapshot already exists for the plan
    TaskNotFound,      //!< Task id not present in the plan
    LockTimeout,       //!< Store lock not acquired within the timeout
    CorruptSnapshot,   //!< Persisted snapshot could not be parsed or validated
    InvalidMutation,   //!< Mutation would break a snapshot invariant
    IoError,           //!< Filesystem operation failed
    InvalidTransition, //!< Requested task or loop state change is not allowed
    InvalidParameter,  //!< Parameter value is invalid or out of range
    ExecutionError,    //!< Agent runner reported a failure
    StuckTimeout,      //!< Task exceeded the stuck threshold
    CommitFailed,      //!< Version control collaborator rejected the commit
    QueueStopped,      //!< Commit queue is stopped or was cleared
    IpcTimeout,        //!< Control request not applied before the timeout
    ProtocolError,     //!< Malformed or incompatible control message
    UnknownCommand,    //!< Control command not recognized
    AlreadyRunning,    //!< Component already started
    NotRunning,        //!< Component not started or already stopped
    PolicyAbort        //!< Start aborted by the uncommitted-changes policy
};
// clang-format on

static_assert(
        static_cast<std::uint32_t>(OrchErrc::PolicyAbort) <=
                std::numeric_limits<std::uint8_t>::max(),
        "OrchErrc enumerator values must fit in std::uint8_t");

} // namespace planorch::engine

// WISE_ENUM_ADAPT must be called at global namespace scope for ADL to work
WISE_ENUM_ADAPT(
        planorch::engine::OrchErrc,
        Success,
        ValidationError,
        CycleError,
        PlanNotFound,
        PlanExists,
        TaskNotFound,
        LockTimeout,
        CorruptSnapshot,
        InvalidMutation,
        IoError,
        InvalidTransition,
        InvalidParameter,
        ExecutionError,
        StuckTimeout,
        CommitFailed,
        QueueStopped,
        IpcTimeout,
        ProtocolError,
        UnknownCommand,
        AlreadyRunning,
        NotRunning,
        PolicyAbort)

// Register OrchErrc as an error code enum to enable implicit conversion to
// std::error_code
namespace std {
template <> struct is_error_code_enum<planorch::engine::OrchErrc> : true_type {};
} // namespace std

namespace planorch::engine {

/**
 * Error category for orchestration errors
 */
class OrchErrorCategory final : public std::error_category {
private:
    // Compile-time table indexed by the enum's underlying value
    static constexpr std::array<std::string_view, 22> KMESSAGES{
            "Success: Operation completed successfully",
            "Validation error: Plan references are invalid",
            "Cycle error: Dependency graph contains a cycle",
            "Plan not found: No status snapshot exists for the plan",
            "Plan exists: A status snapshot already exists for the plan",
            "Task not found: Task id is not part of the plan",
            "Lock timeout: Status store lock could not be acquired in time",
            "Corrupt snapshot: Persisted status could not be parsed",
            "Invalid mutation: Update would violate snapshot invariants",
            "I/O error: Filesystem operation failed",
            "Invalid transition: State change is not allowed from the current state",
            "Invalid parameter: Parameter value is invalid or out of range",
            "Execution error: Agent runner reported a failure",
            "Stuck timeout: Task exceeded the stuck threshold",
            "Commit failed: Version control rejected the commit",
            "Queue stopped: Commit queue is not accepting or processing entries",
            "IPC timeout: Request was not applied before the deadline",
            "Protocol error: Malformed or incompatible control message",
            "Unknown command: Control command is not recognized",
            "Already running: Component has already been started",
            "Not running: Component is not running",
            "Policy abort: Start aborted by the uncommitted-changes policy"};

    static_assert(
            KMESSAGES.size() == ::wise_enum::size<OrchErrc>,
            "KMESSAGES array size must match the number of OrchErrc enum values");

public:
    [[nodiscard]] const char *name() const noexcept override { return "planorch::engine"; }

    /**
     * Get a descriptive message for the given error code
     *
     * @param[in] condition The error code value
     * @return A descriptive error message
     */
    [[nodiscard]] std::string message(const int condition) const override {
        const auto idx = static_cast<std::size_t>(condition);
        if (idx < KMESSAGES.size()) {
            return std::string{*std::next(KMESSAGES.begin(), static_cast<std::ptrdiff_t>(idx))};
        }
        return std::format("Unknown orchestration error: {}", condition);
    }

    /**
     * Map orchestration errors to standard error conditions where applicable
     *
     * @param[in] condition The error code value
     * @return The equivalent standard error condition
     */
    [[nodiscard]] std::error_condition
    default_error_condition(const int condition) const noexcept override {
        switch (static_cast<OrchErrc>(condition)) {
        case OrchErrc::Success:
            return {};
        case OrchErrc::InvalidParameter:
        case OrchErrc::ValidationError:
            return std::errc::invalid_argument;
        case OrchErrc::PlanNotFound:
        case OrchErrc::TaskNotFound:
            return std::errc::no_such_file_or_directory;
        case OrchErrc::PlanExists:
            return std::errc::file_exists;
        case OrchErrc::LockTimeout:
        case OrchErrc::IpcTimeout:
            return std::errc::timed_out;
        case OrchErrc::IoError:
            return std::errc::io_error;
        case OrchErrc::InvalidTransition:
            return std::errc::operation_not_permitted;
        case OrchErrc::ProtocolError:
            return std::errc::protocol_error;
        case OrchErrc::UnknownCommand:
            return std::errc::operation_not_supported;
        default:
            return std::error_condition{condition, *this};
        }
    }
};

/**
 * Get the singleton instance of the orchestration error category
 *
 * @return Reference to the error category
 */
[[nodiscard]] inline const OrchErrorCategory &orch_category() noexcept {
    static const OrchErrorCategory instance{};
    return instance;
}

/**
 * Create an error_code from an OrchErrc value
 *
 * @param[in] errc The orchestration error code
 * @return A std::error_code representing the error
 */
[[nodiscard]] inline std::error_code make_error_code(const OrchErrc errc) noexcept {
    return {static_cast<int>(errc), orch_category()};
}

/**
 * Get the name of an OrchErrc enum value
 *
 * @param[in] errc The error code
 * @return The enum name as a string
 */
[[nodiscard]] inline const char *get_error_name(const OrchErrc errc) noexcept {
    return ::wise_enum::to_string(errc).data();
}

/**
 * Get the name of an OrchErrc from a std::error_code
 *
 * @param[in] ec The error code
 * @return The enum name, or "unknown" for codes of another category
 */
[[nodiscard]] inline const char *get_error_name(const std::error_code &ec) noexcept {
    if (ec.category() != orch_category()) {
        return "unknown";
    }
    return get_error_name(static_cast<OrchErrc>(ec.value()));
}

/**
 * Error value carried by engine results
 *
 * The code classifies the failure; the message names the offending plan,
 * task or file.
 */
struct Error final {
    std::error_code code; //!< Classification, usually of orch_category()
    std::string message;  //!< Human readable detail

    /**
     * Check whether this error has the given classification
     *
     * @param[in] errc Code to compare with
     * @return true if code equals errc
     */
    [[nodiscard]] bool is(const OrchErrc errc) const noexcept { return code == errc; }

    /**
     * Format as "<Name>: <message>"
     */
    [[nodiscard]] std::string to_string() const {
        return std::format("{}: {}", get_error_name(code), message);
    }
};

/**
 * Result of a fallible engine operation
 */
template <typename T> using Result = tl::expected<T, Error>;

/**
 * Result of a fallible engine operation that produces no value
 */
using Status = tl::expected<void, Error>;

/**
 * Build an unexpected Error for returning from a Result function
 *
 * @param[in] errc Classification
 * @param[in] message Detail message
 * @return tl::unexpected wrapping the error
 */
[[nodiscard]] inline tl::unexpected<Error> make_error(const OrchErrc errc, std::string message) {
    return tl::unexpected(Error{make_error_code(errc), std::move(message)});
}

} // namespace planorch::engine

#endif // PLANORCH_ENGINE_ENGINE_ERRORS_HPP
