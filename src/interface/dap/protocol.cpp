/** LICENSE TEMPLATE */
#include "protocol.h"

// dapsync
#include <utils/logger.h>

namespace dapsync::ui::dap {

Dict
Event(i64 seq, std::string_view event) noexcept
{
  Dict dict;
  dict["seq"] = seq;
  dict["type"] = "event";
  dict["event"] = event;
  dict["body"] = Dict::object();
  return dict;
}

Dict
Request(i64 seq, std::string_view command, Dict arguments) noexcept
{
  Dict dict;
  dict["seq"] = seq;
  dict["type"] = "request";
  dict["command"] = command;
  dict["arguments"] = std::move(arguments);
  return dict;
}

Dict
Response(i64 seq, i64 requestSeq, bool success, std::string_view command, Option<std::string_view> errMessage,
         Dict body) noexcept
{
  Dict dict;
  dict["seq"] = seq;
  dict["type"] = "response";
  dict["request_seq"] = requestSeq;
  dict["success"] = success;
  dict["command"] = command;
  if (!success && errMessage) {
    dict["message"] = *errMessage;
  }
  dict["body"] = std::move(body);
  return dict;
}

Dict
OutputEvent(i64 seq, std::string_view category, std::string_view output) noexcept
{
  Dict dict = Event(seq, "output");
  auto &body = dict["body"];
  body["category"] = category;
  // Clients print output verbatim.
  body["output"] = fmt::format("{}\n", output);
  return dict;
}

std::string
Serialize(const Dict &message) noexcept
{
  return message.dump(-1, ' ', false, Dict::error_handler_t::replace);
}

Option<Dict>
ParseProtocolMessage(std::string_view payload) noexcept
{
  auto parsed = Dict::parse(payload.begin(), payload.end(), nullptr, false);
  if (parsed.is_discarded() || !parsed.is_object()) {
    DBGLOG(dap, "not a protocol message: '{}'", payload);
    return std::nullopt;
  }
  if (!GetString(parsed, "type")) {
    DBGLOG(dap, "protocol message without type: '{}'", payload);
    return std::nullopt;
  }
  return parsed;
}

Option<i64>
GetInteger(const Dict &object, std::string_view key) noexcept
{
  const auto it = object.find(std::string{ key });
  if (it == object.end() || !it->is_number_integer()) {
    return std::nullopt;
  }
  return it->get<i64>();
}

Option<std::string>
GetString(const Dict &object, std::string_view key) noexcept
{
  const auto it = object.find(std::string{ key });
  if (it == object.end() || !it->is_string()) {
    return std::nullopt;
  }
  return it->get<std::string>();
}

Option<bool>
GetBoolean(const Dict &object, std::string_view key) noexcept
{
  const auto it = object.find(std::string{ key });
  if (it == object.end() || !it->is_boolean()) {
    return std::nullopt;
  }
  return it->get<bool>();
}

const Dict *
GetObject(const Dict &object, std::string_view key) noexcept
{
  const auto it = object.find(std::string{ key });
  if (it == object.end() || !it->is_object()) {
    return nullptr;
  }
  return &(*it);
}

const Dict *
GetArray(const Dict &object, std::string_view key) noexcept
{
  const auto it = object.find(std::string{ key });
  if (it == object.end() || !it->is_array()) {
    return nullptr;
  }
  return &(*it);
}

} // namespace dapsync::ui::dap
