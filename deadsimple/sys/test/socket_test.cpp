#include "deadsimple/socket.hpp"

#include <gtest/gtest.h>
#include <sys/socket.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

#include "deadsimple/connection.hpp"

using namespace deadsimple;
using namespace std::chrono_literals;

TEST(SocketTest, BindEphemeralPortUpdatesPort) {
  Socket listener(0);
  uint16_t port = 0;
  listener.bindAndListen("127.0.0.1", false, port);
  EXPECT_NE(port, 0);
}

TEST(SocketTest, UnresolvableAddressThrows) {
  Socket listener(0);
  uint16_t port = 0;
  EXPECT_THROW(listener.bindAndListen("definitely.not.a.host.invalid", false, port), std::invalid_argument);
}

TEST(SocketTest, AcceptTimesOutWithEmptyConnection) {
  Socket listener(0);
  uint16_t port = 0;
  listener.bindAndListen("127.0.0.1", false, port);
  Connection conn = listener.accept(10ms);
  EXPECT_FALSE(conn);
}

TEST(SocketTest, ConnectAcceptExchangeBytes) {
  Socket listener(0);
  uint16_t port = 0;
  listener.bindAndListen("localhost", false, port);

  Socket client(0);
  client.connect("127.0.0.1", port);

  Connection server = listener.accept(1000ms);
  ASSERT_TRUE(server);
  EXPECT_TRUE(server.peer().starts_with("127.0.0.1:"));

  ASSERT_TRUE(server.sendAll("pong"));
  server.close();

  std::string received;
  char buf[16];
  while (true) {
    const auto nbRead = ::recv(client.fd(), buf, sizeof(buf), 0);
    if (nbRead <= 0) {
      break;
    }
    received.append(buf, static_cast<std::size_t>(nbRead));
  }
  EXPECT_EQ(received, "pong");
}
