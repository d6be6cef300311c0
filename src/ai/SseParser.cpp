// SPDX-License-Identifier: Apache-2.0
#include "SseParser.hpp"

namespace vocatype
{

auto SseParser::feed(std::string_view chunk) -> std::vector<SseEvent>
{
    auto events = std::vector<SseEvent> {};
    for (auto const c: chunk)
    {
        if (_skipLf)
        {
            _skipLf = false;
            if (c == '\n')
                continue;
        }

        if (c == '\r')
        {
            processLine(events);
            _skipLf = true;
        }
        else if (c == '\n')
            processLine(events);
        else
            _line += c;
    }
    return events;
}

auto SseParser::finish() -> std::optional<SseEvent>
{
    auto events = std::vector<SseEvent> {};
    if (!_line.empty())
        processLine(events);
    dispatch(events);
    _skipLf = false;
    if (events.empty())
        return std::nullopt;
    return std::move(events.front());
}

void SseParser::reset()
{
    _line.clear();
    _event.clear();
    _data.clear();
    _lastId.clear();
    _hasData = false;
    _skipLf = false;
}

void SseParser::processLine(std::vector<SseEvent>& out)
{
    auto line = std::move(_line);
    _line.clear();

    if (line.empty())
    {
        dispatch(out);
        return;
    }
    if (line.front() == ':')
        return;

    auto field = std::string_view { line };
    auto value = std::string_view {};
    if (auto const colon = field.find(':'); colon != std::string_view::npos)
    {
        value = field.substr(colon + 1);
        field = field.substr(0, colon);
        if (value.starts_with(' '))
            value.remove_prefix(1);
    }

    if (field == "event")
        _event = value;
    else if (field == "data")
    {
        if (_hasData)
            _data += '\n';
        _data += value;
        _hasData = true;
    }
    else if (field == "id")
        _lastId = value;
    // "retry" and unknown fields are ignored
}

void SseParser::dispatch(std::vector<SseEvent>& out)
{
    if (_hasData)
    {
        out.push_back(SseEvent {
            .event = _event.empty() ? std::string("message") : _event,
            .data = std::move(_data),
            .id = _lastId,
        });
    }
    _event.clear();
    _data.clear();
    _hasData = false;
}

} // namespace vocatype
