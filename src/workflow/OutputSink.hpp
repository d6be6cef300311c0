// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Types.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace vocatype
{

/// @brief Receives the observable output of the workflow (UI, clipboard, terminal).
///
/// deliver(), reportState() and reportLevel() are called from the coordinator thread.
/// reportToken() and discardTokens() are called from the processing thread while a response streams
/// in, so implementations that share state between the two groups must synchronize it.
class OutputSink
{
  public:
    virtual ~OutputSink() = default;

    /// @brief Hands over the final text of a completed workflow.
    virtual void deliver(const std::string& text) = 0;

    /// @brief Reports a state transition, with an optional human-readable detail (e.g. an error).
    virtual void reportState(WorkflowState state, std::optional<std::string_view> detail) = 0;

    /// @brief Reports the input level (0..1) while listening, at most 60 times per second.
    virtual void reportLevel(float level) = 0;

    /// @brief Live display of a streamed token.
    virtual void reportToken(std::string_view /*token*/) {}

    /// @brief The tokens reported so far belong to a failed attempt and are being replaced.
    virtual void discardTokens() {}
};

} // namespace vocatype
