/** LICENSE TEMPLATE */
#include "parse_buffer.h"

// dapsync
#include <utils/logger.h>
#include <utils/util.h>

// fmt
#include <fmt/core.h>

namespace dapsync::ui::dap {

static const std::regex CONTENT_LENGTH_HEADER = std::regex{ R"(Content-Length: (\d+)\r\n\r\n)" };

std::string_view
ContentDescriptor::payload() const noexcept
{
  return std::string_view{ payload_begin, payload_begin + payload_length };
}

u64
ContentDescriptor::end_offset() const noexcept
{
  return packet_offset + static_cast<u64>(payload_begin - header_begin) + payload_length;
}

std::vector<ContentParse>
ParseHeadersFrom(const std::string_view buffer_view, bool *all_msgs_ok) noexcept
{
  std::vector<ContentParse> result;

  std::string_view internal_view{ buffer_view };
  ViewMatchResult base_match;
  bool partial_found = false;
  while (std::regex_search(internal_view.begin(), internal_view.end(), base_match, CONTENT_LENGTH_HEADER)) {
    if (base_match.size() != 2) {
      break;
    }
    std::sub_match<std::string_view::const_iterator> base_sub_match = base_match[1];
    std::string_view len_str{ base_sub_match.first, base_sub_match.second };
    const auto res = ToIntegral<u64>(len_str);
    if (!res) {
      DBGLOG(warning, "dropping header with unusable Content-Length: '{}'", len_str);
      internal_view.remove_prefix(base_match.position() + base_match.length());
      continue;
    }
    const auto len = res.value();
    const auto header_begin_ptr = internal_view.data() + base_match.position();
    const auto packet_offset = static_cast<u64>(header_begin_ptr - buffer_view.data());
    const auto packet_end = static_cast<u64>(base_match.position() + base_match.length()) + len;
    if (packet_end <= internal_view.size()) {
      const auto payload_begin_ptr = header_begin_ptr + base_match.length();
      result.push_back(ContentDescriptor{ .payload_length = len,
        .packet_offset = packet_offset,
        .header_begin = header_begin_ptr,
        .payload_begin = payload_begin_ptr });
      internal_view.remove_prefix(packet_end);
    } else {
      result.push_back(PartialContentDescriptor{ .payload_length = len,
        .payload_missing = packet_end - internal_view.size(),
        .packet_offset = packet_offset });
      internal_view.remove_prefix(internal_view.size());
      partial_found = true;
    }
  }
  if (!internal_view.empty()) {
    const u64 offset = static_cast<u64>(internal_view.data() - buffer_view.data());
    result.push_back(RemainderData{ .length = internal_view.size(), .offset = offset });
    partial_found = true;
  }
  if (all_msgs_ok != nullptr) {
    *all_msgs_ok = !partial_found;
  }
  return result;
}

std::string
FrameProtocolMessage(std::string_view payload) noexcept
{
  return fmt::format("Content-Length: {}\r\n\r\n{}", payload.size(), payload);
}

void
MessageBuffer::Append(std::string_view bytes) noexcept
{
  mBuffer.append(bytes);
}

std::vector<std::string>
MessageBuffer::TakeMessages() noexcept
{
  std::vector<std::string> messages;
  bool no_partials = false;
  const auto parsed = ParseHeadersFrom(mBuffer, &no_partials);
  u64 consumed = 0;
  for (const auto &item : parsed) {
    if (const auto *cd = std::get_if<ContentDescriptor>(&item); cd) {
      messages.emplace_back(cd->payload());
      consumed = cd->end_offset();
    } else if (const auto *partial = std::get_if<PartialContentDescriptor>(&item); partial) {
      DBGLOG(dap, "waiting for {} more bytes of a {} byte message", partial->payload_missing,
             partial->payload_length);
      consumed = partial->packet_offset;
    } else if (const auto *rd = std::get_if<RemainderData>(&item); rd) {
      consumed = rd->offset;
    }
  }

  if (no_partials) {
    mBuffer.clear();
  } else {
    mBuffer.erase(0, consumed);
  }
  return messages;
}

u64
MessageBuffer::BufferedBytes() const noexcept
{
  return mBuffer.size();
}

} // namespace dapsync::ui::dap
