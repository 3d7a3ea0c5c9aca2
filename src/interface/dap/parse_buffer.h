/** LICENSE TEMPLATE */
#pragma once
// dapsync
#include <common/macros.h>
#include <common/typedefs.h>

// std
#include <regex>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace dapsync::ui::dap {

// We've parsed the header of a message and we've verified that the body is contained in the buffer.
// - `payload_length` is the length of the body
// - `packet_offset` is the offset of the header into the buffer
// - `payload_begin` points to the first byte of the body in the buffer
struct ContentDescriptor
{
  u64 payload_length;
  u64 packet_offset;
  const char *header_begin;
  const char *payload_begin;

  std::string_view payload() const noexcept;
  // Offset one past the last byte of this message.
  u64 end_offset() const noexcept;
};

// We've parsed the header of a message, but we haven't read the entire body.
// - `payload_missing` is how much of the body was missing
// - `packet_offset` is where the header starts; everything from there on has to be kept for the next read.
struct PartialContentDescriptor
{
  u64 payload_length;
  u64 payload_missing;
  u64 packet_offset;
};

// Data we couldn't parse a "Content-Length" header from, which most likely means we've only read part of the
// header. It is always the last item found in the buffer.
struct RemainderData
{
  u64 length;
  u64 offset;
};

using ViewMatchResult = std::match_results<std::string_view::const_iterator>;
using ContentParse = std::variant<ContentDescriptor, PartialContentDescriptor, RemainderData>;

// Finds all messages in `buffer_view`. `all_msgs_ok` (if not null) is set to true when the buffer ends exactly
// at the end of a complete message.
std::vector<ContentParse> ParseHeadersFrom(std::string_view buffer_view, bool *all_msgs_ok = nullptr) noexcept;

// "Content-Length: <n>\r\n\r\n<payload>"
std::string FrameProtocolMessage(std::string_view payload) noexcept;

// Accumulates bytes read from one direction of a DAP connection and hands out complete message payloads.
class MessageBuffer
{
  std::string mBuffer{};

public:
  MessageBuffer() noexcept = default;
  NO_COPY_DEFAULTED_MOVE(MessageBuffer);

  void Append(std::string_view bytes) noexcept;
  // Removes and returns every complete message payload, in order. Incomplete data stays buffered.
  std::vector<std::string> TakeMessages() noexcept;
  u64 BufferedBytes() const noexcept;
};

} // namespace dapsync::ui::dap
