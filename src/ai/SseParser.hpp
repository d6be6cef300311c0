// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace vocatype
{

/// @brief One dispatched Server-Sent Event.
struct SseEvent
{
    std::string event = "message";
    std::string data;
    std::string id;
};

/// @brief Incremental Server-Sent Events parser.
///
/// Accepts the response body in arbitrary chunks (split anywhere, including inside a CRLF pair) and
/// returns each event once its terminating blank line has arrived.
class SseParser
{
  public:
    /// @brief Consumes a chunk and returns the events it completed.
    [[nodiscard]] auto feed(std::string_view chunk) -> std::vector<SseEvent>;

    /// @brief Flushes a trailing event that was not terminated by a blank line.
    [[nodiscard]] auto finish() -> std::optional<SseEvent>;

    void reset();

  private:
    void processLine(std::vector<SseEvent>& out);
    void dispatch(std::vector<SseEvent>& out);

    std::string _line;
    std::string _event;
    std::string _data;
    std::string _lastId;
    bool _hasData = false;
    bool _skipLf = false;
};

} // namespace vocatype
