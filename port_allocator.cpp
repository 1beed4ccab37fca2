#include "port_allocator.hpp"

#include <boost/asio.hpp>
#include <string>

#include "device_error.hpp"
#include "log.hpp"

using boost::asio::ip::tcp;

bool TcpPortProbe::in_use(int port) {
  boost::asio::io_context io_context;
  tcp::socket socket(io_context);
  tcp::endpoint endpoint(boost::asio::ip::address_v4::loopback(),
                         static_cast<unsigned short>(port));

  boost::system::error_code ec;
  socket.connect(endpoint, ec);
  if (ec) {
    return false;
  }
  socket.close(ec);
  return true;
}

int PortAllocator::allocate(int rangeStart, int rangeEnd) {
  if (rangeStart < 1 || rangeEnd > 65535 || rangeStart > rangeEnd) {
    throw UsageError("Invalid port range " + std::to_string(rangeStart) + "-" +
                     std::to_string(rangeEnd));
  }

  log_warning("Searching free port in range " + std::to_string(rangeStart) + " to " +
              std::to_string(rangeEnd));
  for (int port = rangeStart; port <= rangeEnd; ++port) {
    if (!probe_.in_use(port)) {
      log_info("Free port found: " + std::to_string(port));
      return port;
    }
  }
  throw DeviceError(ErrorKind::NoFreePort,
                    "No free port found in range " + std::to_string(rangeStart) + "-" +
                    std::to_string(rangeEnd));
}
