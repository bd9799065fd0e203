#pragma once
#include <cstdint>
#include <string>
#include <vector>

#include "platform/IForwarder.hpp"

namespace platform {

struct UdpForwarderConfig {
    std::string HOST = "127.0.0.1";
    uint16_t PORT = 9750;
    uint32_t TIMEOUT_MS = 500;     // per datagram send timeout
};

// ---------------------------------------------------------------------------
//  UdpForwarder
// ---------------------------------------------------------------------------
// One ASCII datagram per stored reading:
//   R,<id>,<tag>,<d0>,...,<d7>,<kx>,<ky>,<t_us>
// Absent values are empty fields. Only the forwarding thread may call forward().
class UdpForwarder : public IForwarder {
public:
    explicit UdpForwarder(const UdpForwarderConfig& cfg = {});
    ~UdpForwarder() override;

    UdpForwarder(const UdpForwarder&) = delete;
    UdpForwarder& operator=(const UdpForwarder&) = delete;

    // Open the socket and resolve the destination. Returns false on any failure.
    bool Start();
    void Stop();

    bool forward(const std::vector<msg::StoredReading>& rows) override;

    static std::string formatRow(const msg::StoredReading& row);

private:
    UdpForwarderConfig m_cfg{};
    int m_fd = -1;
    // Destination in network byte order (kept as integers to avoid socket headers here)
    uint32_t m_dest_addr = 0;
    uint16_t m_dest_port = 0;
};

} // namespace platform
