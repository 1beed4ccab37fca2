/**
 * @file test_port_allocator.cpp
 * @brief PortAllocator scan order, exhaustion and the real TCP probe.
 */

#include <gtest/gtest.h>

#include <boost/asio.hpp>

#include "device_error.hpp"
#include "fakes.hpp"
#include "port_allocator.hpp"

TEST(PortAllocatorTest, ReturnsLowestFreePort) {
  FakePortProbe probe;
  probe.busy = {22400, 22401};
  PortAllocator allocator(probe);

  EXPECT_EQ(allocator.allocate(22400, 22500), 22402);
  EXPECT_EQ(probe.probed, (std::vector<int>{22400, 22401, 22402}));
}

TEST(PortAllocatorTest, SkipsOccupiedPortsInTheMiddle) {
  FakePortProbe probe;
  probe.busy = {22400, 22402};
  PortAllocator allocator(probe);

  EXPECT_EQ(allocator.allocate(22400, 22500), 22401);
}

TEST(PortAllocatorTest, FullyOccupiedRangeIsNoFreePort) {
  FakePortProbe probe;
  for (int port = 22400; port <= 22500; ++port) {
    probe.busy.insert(port);
  }
  PortAllocator allocator(probe);

  try {
    allocator.allocate(22400, 22500);
    FAIL() << "expected NoFreePort";
  } catch (const DeviceError& e) {
    EXPECT_EQ(e.kind(), ErrorKind::NoFreePort);
  }
  EXPECT_EQ(probe.probed.size(), 101u);
}

TEST(PortAllocatorTest, SinglePortRange) {
  FakePortProbe probe;
  PortAllocator allocator(probe);

  EXPECT_EQ(allocator.allocate(22405, 22405), 22405);
}

TEST(PortAllocatorTest, InvalidRangeIsRejected) {
  FakePortProbe probe;
  PortAllocator allocator(probe);

  EXPECT_THROW(allocator.allocate(22500, 22400), UsageError);
  EXPECT_THROW(allocator.allocate(0, 10), UsageError);
  EXPECT_THROW(allocator.allocate(65000, 70000), UsageError);
  EXPECT_TRUE(probe.probed.empty());
}

// A port held by a live listener is never handed out.
TEST(PortAllocatorTest, NeverReturnsPortHeldByListener) {
  using boost::asio::ip::tcp;
  boost::asio::io_context io_context;
  tcp::acceptor acceptor(io_context,
                         tcp::endpoint(boost::asio::ip::address_v4::loopback(), 0));
  const int held = acceptor.local_endpoint().port();

  TcpPortProbe probe;
  EXPECT_TRUE(probe.in_use(held));

  PortAllocator allocator(probe);
  try {
    allocator.allocate(held, held);
    FAIL() << "allocated a port with a listener on it";
  } catch (const DeviceError& e) {
    EXPECT_EQ(e.kind(), ErrorKind::NoFreePort);
  }
}
