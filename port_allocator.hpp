#ifndef PORT_ALLOCATOR_HPP
#define PORT_ALLOCATOR_HPP

// Tells whether something on this host already answers on a TCP port.
class PortProbe {
 public:
  virtual ~PortProbe() = default;
  virtual bool in_use(int port) = 0;
};

// Connects to 127.0.0.1:<port>; a successful connect means the port is taken.
class TcpPortProbe : public PortProbe {
 public:
  bool in_use(int port) override;
};

// Finds the host port for the guest ssh forward.
//
// The scan is a check, not a reservation: the emulator binds the port later,
// so another process may take it in between.
class PortAllocator {
 public:
  explicit PortAllocator(PortProbe& probe) : probe_(probe) {}

  // Returns the lowest free port in [rangeStart, rangeEnd].
  // Throws DeviceError(NoFreePort) if every port answers, and UsageError if
  // the range itself is malformed.
  int allocate(int rangeStart, int rangeEnd);

 private:
  PortProbe& probe_;
};

#endif // PORT_ALLOCATOR_HPP
