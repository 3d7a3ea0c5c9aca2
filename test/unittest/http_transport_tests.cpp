#include <gtest/gtest.h>

#include <sync/http_viewer_transport.h>
#include <utils/scoped_fd.h>

#include <array>
#include <future>
#include <thread>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

using namespace dapsync;
using namespace std::chrono_literals;

namespace {

// Listens on an ephemeral loopback port. Serves exactly one connection with a canned response.
class OneShotServer
{
public:
  explicit OneShotServer(bool listen = true)
      : mSocket(::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0))
  {
    sockaddr_in address{};
    address.sin_family = AF_INET;
    address.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    address.sin_port = 0;
    EXPECT_EQ(::bind(mSocket, reinterpret_cast<sockaddr *>(&address), sizeof(address)), 0);
    socklen_t length = sizeof(address);
    EXPECT_EQ(::getsockname(mSocket, reinterpret_cast<sockaddr *>(&address), &length), 0);
    mPort = ntohs(address.sin_port);
    if (listen) {
      EXPECT_EQ(::listen(mSocket, 1), 0);
    }
  }

  // Accepts one connection, reads the request, answers with `response`. The request is the future's value.
  std::future<std::string>
  Serve(std::string response)
  {
    return std::async(std::launch::async, [this, response = std::move(response)]() {
      ScopedFd client{ ::accept4(mSocket, nullptr, nullptr, SOCK_CLOEXEC) };
      std::string request;
      std::array<char, 1024> buffer;
      // Headers, then a body of Content-Length bytes. The goto request body is small JSON.
      while (request.find("\r\n\r\n") == std::string::npos || !request.ends_with("}")) {
        const auto bytes = ::read(client, buffer.data(), buffer.size());
        if (bytes <= 0) {
          break;
        }
        request.append(buffer.data(), static_cast<size_t>(bytes));
      }
      EXPECT_TRUE(client.WriteAll(response));
      return request;
    });
  }

  u16
  Port() const
  {
    return mPort;
  }

private:
  ScopedFd mSocket;
  u16 mPort{ 0 };
};

} // namespace

TEST(HttpViewerTransport, ParsesStatusLine)
{
  EXPECT_EQ(sync::HttpViewerTransport::ParseStatusLine("HTTP/1.1 200 OK\r\n"), 200);
  EXPECT_EQ(sync::HttpViewerTransport::ParseStatusLine("HTTP/1.0 404 Not Found\r\n\r\n"), 404);
  EXPECT_EQ(sync::HttpViewerTransport::ParseStatusLine("HTTP/1.1 204\r\n"), 204);
  EXPECT_EQ(sync::HttpViewerTransport::ParseStatusLine("HTTP/1.1 500"), 500);
  EXPECT_FALSE(sync::HttpViewerTransport::ParseStatusLine(""));
  EXPECT_FALSE(sync::HttpViewerTransport::ParseStatusLine("HTTP/2 200\r\n"));
  EXPECT_FALSE(sync::HttpViewerTransport::ParseStatusLine("HTTP/1.1 2000 OK\r\n"));
  EXPECT_FALSE(sync::HttpViewerTransport::ParseStatusLine("HTTP/1.1 abc OK\r\n"));
  EXPECT_FALSE(sync::HttpViewerTransport::ParseStatusLine("HTTP/1.1 042 OK\r\n"));
  EXPECT_FALSE(sync::HttpViewerTransport::ParseStatusLine("SSH-2.0-OpenSSH_9.6\r\n"));
}

TEST(HttpViewerTransport, BuildsGotoRequest)
{
  const auto request = sync::HttpViewerTransport::BuildGotoRequest(
    sync::ViewerEndpoint{ .mHost = "127.0.0.1", .mPort = 18888 }, "0x401020");
  EXPECT_EQ(request,
    "POST /goto HTTP/1.1\r\n"
    "Host: 127.0.0.1:18888\r\n"
    "Content-Type: application/json\r\n"
    "Content-Length: 22\r\n"
    "Connection: close\r\n"
    "\r\n"
    R"({"address":"0x401020"})");
}

TEST(HttpViewerTransport, BracketsIpv6Hosts)
{
  const auto request =
    sync::HttpViewerTransport::BuildGotoRequest(sync::ViewerEndpoint{ .mHost = "::1", .mPort = 80 }, "0x1");
  EXPECT_NE(request.find("Host: [::1]:80\r\n"), std::string::npos);
}

TEST(HttpViewerTransport, DeliversAddressAndReportsStatus)
{
  OneShotServer server;
  auto request = server.Serve("HTTP/1.1 200 OK\r\nContent-Length: 0\r\nConnection: close\r\n\r\n");
  const auto result = sync::HttpViewerTransport::SendGotoRequest(
    sync::ViewerEndpoint{ .mHost = "127.0.0.1", .mPort = server.Port() }, "0x7fff0001", 2000ms);
  ASSERT_TRUE(result.has_value()) << result.error().mMessage;
  EXPECT_EQ(*result, 200);

  const auto received = request.get();
  EXPECT_TRUE(received.starts_with("POST /goto HTTP/1.1\r\n")) << received;
  EXPECT_TRUE(received.ends_with(R"({"address":"0x7fff0001"})")) << received;
}

TEST(HttpViewerTransport, NonSuccessStatusIsStillAResponse)
{
  OneShotServer server;
  auto request = server.Serve("HTTP/1.1 404 Not Found\r\n\r\n");
  const auto result = sync::HttpViewerTransport::SendGotoRequest(
    sync::ViewerEndpoint{ .mHost = "127.0.0.1", .mPort = server.Port() }, "0x10", 2000ms);
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(*result, 404);
  request.wait();
}

TEST(HttpViewerTransport, GarbageResponseIsMalformed)
{
  OneShotServer server;
  auto request = server.Serve("hello\r\n");
  const auto result = sync::HttpViewerTransport::SendGotoRequest(
    sync::ViewerEndpoint{ .mHost = "127.0.0.1", .mPort = server.Port() }, "0x10", 2000ms);
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().mKind, sync::TransportError::Kind::MalformedResponse);
  request.wait();
}

TEST(HttpViewerTransport, NobodyListeningIsAConnectError)
{
  OneShotServer server{ false };
  const auto result = sync::HttpViewerTransport::SendGotoRequest(
    sync::ViewerEndpoint{ .mHost = "127.0.0.1", .mPort = server.Port() }, "0x10", 500ms);
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().mKind, sync::TransportError::Kind::Connect);
}

TEST(HttpViewerTransport, CompletionsArePostedThroughThePoster)
{
  OneShotServer server;
  auto request = server.Serve("HTTP/1.1 200 OK\r\n\r\n");
  std::promise<std::function<void()>> posted;
  sync::HttpViewerTransport transport{ [&posted](std::function<void()> task) { posted.set_value(std::move(task)); } };

  Option<sync::TransportResult> result;
  transport.PostGoto(sync::ViewerEndpoint{ .mHost = "127.0.0.1", .mPort = server.Port() }, "0x20",
    [&result](sync::TransportResult r) { result = std::move(r); });

  auto completion = posted.get_future();
  ASSERT_EQ(completion.wait_for(5s), std::future_status::ready);
  EXPECT_FALSE(result.has_value());
  completion.get()();
  ASSERT_TRUE(result.has_value());
  ASSERT_TRUE(result->has_value());
  EXPECT_EQ(**result, 200);
  request.wait();
}
