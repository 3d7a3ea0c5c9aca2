/** LICENSE TEMPLATE */
#pragma once
// dapsync
#include <common/typedefs.h>

// std
#include <string>
#include <string_view>

// nlohmann
#include <nlohmann/json.hpp>

namespace dapsync::ui::dap {

using Dict = nlohmann::json;

// Sequence numbers of messages dapsync itself originates start here, far above anything a client or adapter
// will reach, so they can be told apart from relayed traffic.
static constexpr i64 kInjectedSequenceStart = 1'000'000'000;

Dict Request(i64 seq, std::string_view command, Dict arguments) noexcept;
Dict Event(i64 seq, std::string_view event) noexcept;
Dict Response(i64 seq, i64 requestSeq, bool success, std::string_view command,
              Option<std::string_view> errMessage, Dict body = Dict::object()) noexcept;

/** `output` event. `category` is one of DAP's output categories, i.e. "console", "important", "stdout". */
Dict OutputEvent(i64 seq, std::string_view category, std::string_view output) noexcept;

// Never throws. Invalid UTF-8 in strings is replaced.
std::string Serialize(const Dict &message) noexcept;

// Parses a message payload. Returns nullopt (and logs) for anything that is not a JSON object with a `type`.
Option<Dict> ParseProtocolMessage(std::string_view payload) noexcept;

// Typed getters that never throw. A missing key or a value of the wrong type yields nullopt.
Option<i64> GetInteger(const Dict &object, std::string_view key) noexcept;
Option<std::string> GetString(const Dict &object, std::string_view key) noexcept;
Option<bool> GetBoolean(const Dict &object, std::string_view key) noexcept;
const Dict *GetObject(const Dict &object, std::string_view key) noexcept;
const Dict *GetArray(const Dict &object, std::string_view key) noexcept;

} // namespace dapsync::ui::dap
