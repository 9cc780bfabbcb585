#include "Server.hpp"

#include <gtest/gtest.h>

#include <cerrno>
#include <string>

TEST(ServerTests, DefaultConstructorInitializesFields) {
  Server s;
  EXPECT_EQ(s.fd, -1);
  EXPECT_EQ(s.host, "0.0.0.0");
  EXPECT_EQ(s.port, 80);
}

TEST(ServerTests, ParameterizedConstructorSetsHostAndPort) {
  Server s("127.0.0.1", 9090);
  EXPECT_EQ(s.host, "127.0.0.1");
  EXPECT_EQ(s.port, 9090);
  EXPECT_EQ(s.fd, -1);
}

TEST(ServerTests, InitListensOnEphemeralPort) {
  Server s("127.0.0.1", 0);
  s.init();
  EXPECT_GE(s.fd, 0);
  EXPECT_GT(s.boundPort(), 0);
  s.disconnect();
  EXPECT_EQ(s.fd, -1);
}

TEST(ServerTests, PortInUseThrowsListenError) {
  Server blocker("127.0.0.1", 0);
  blocker.init();
  int port = blocker.boundPort();

  Server s("127.0.0.1", port);
  try {
    s.init();
    FAIL() << "expected ListenError";
  } catch (const ListenError& e) {
    EXPECT_EQ(e.error(), EADDRINUSE);
    EXPECT_NE(std::string(e.what()).find("already in use"), std::string::npos);
  }
  EXPECT_EQ(s.fd, -1);
}

TEST(ServerTests, UnavailableAddressThrowsListenError) {
  // TEST-NET-1 is never assigned to a local interface
  Server s("192.0.2.1", 0);
  try {
    s.init();
    FAIL() << "expected ListenError";
  } catch (const ListenError& e) {
    EXPECT_EQ(e.error(), EADDRNOTAVAIL);
    EXPECT_NE(std::string(e.what()).find("bind 192.0.2.1:0"),
              std::string::npos);
  }
  EXPECT_EQ(s.fd, -1);
}

TEST(ServerTests, DescribeNamesThePortForAddressInUse) {
  EXPECT_EQ(ListenError::describe("bind", "0.0.0.0", 8080, EADDRINUSE),
            "port 8080 already in use");
  EXPECT_EQ(ListenError::describe("listen", "0.0.0.0", 8080, EACCES).find(
                "listen 0.0.0.0:8080 failed: "),
            0u);
}
