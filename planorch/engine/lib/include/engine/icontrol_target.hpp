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
 * @file icontrol_target.hpp
 * @brief Interface for receivers of orchestration control commands
 */

#ifndef PLANORCH_ENGINE_ICONTROL_TARGET_HPP
#define PLANORCH_ENGINE_ICONTROL_TARGET_HPP

#include <memory>

#include "engine/orchestrator_types.hpp"

namespace planorch::engine {

/**
 * @class IControlTarget
 * @brief Accepts control commands and reports loop status
 *
 * Control surfaces depend on this interface rather than on the loop
 * itself. submit() and status() may be called from any thread.
 */
class IControlTarget {
public:
    /**
     * Default constructor.
     */
    IControlTarget() = default;

    /**
     * Virtual destructor.
     */
    virtual ~IControlTarget() = default;

    IControlTarget(IControlTarget &&) = default;
    IControlTarget &operator=(IControlTarget &&) = default;
    IControlTarget(const IControlTarget &) = delete;
    IControlTarget &operator=(const IControlTarget &) = delete;

    /**
     * Queue a control command
     *
     * @param[in] command Command to apply
     * @return Handle resolved once the command is applied or rejected
     */
    [[nodiscard]] virtual std::shared_ptr<PendingControl> submit(ControlCommand command) = 0;

    /**
     * Latest status
     */
    [[nodiscard]] virtual OrchestratorStatus status() const = 0;
};

} // namespace planorch::engine

#endif // PLANORCH_ENGINE_ICONTROL_TARGET_HPP
