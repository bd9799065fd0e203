#include "platform/linux/UdpForwarder.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <iostream>

// POSIX sockets (Linux)
#include <sys/socket.h>
#include <sys/time.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <unistd.h>

namespace platform {

namespace {

void appendNumber(std::string& s, double v) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.6f", v);
    s += buf;
}

} // namespace

UdpForwarder::UdpForwarder(const UdpForwarderConfig& cfg)
    : m_cfg(cfg) {
    if (m_cfg.TIMEOUT_MS == 0) m_cfg.TIMEOUT_MS = 500;
}

UdpForwarder::~UdpForwarder() {
    Stop();
}

bool UdpForwarder::Start() {
    if (m_fd >= 0) return true;

    in_addr addr{};
    if (::inet_pton(AF_INET, m_cfg.HOST.c_str(), &addr) != 1) {
        std::cerr << "[FWD] invalid IPv4 host '" << m_cfg.HOST << "'\n";
        return false;
    }

    const int fd = ::socket(AF_INET, SOCK_DGRAM, 0);
    if (fd < 0) {
        std::cerr << "[FWD] socket() failed errno=" << errno << " " << std::strerror(errno) << "\n";
        return false;
    }

    timeval tv{};
    tv.tv_sec  = m_cfg.TIMEOUT_MS / 1000;
    tv.tv_usec = (m_cfg.TIMEOUT_MS % 1000) * 1000;
    if (::setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) < 0) {
        std::cerr << "[FWD] setsockopt(SO_SNDTIMEO) failed errno=" << errno << "\n";
        ::close(fd);
        return false;
    }

    m_fd = fd;
    m_dest_addr = addr.s_addr;
    m_dest_port = htons(m_cfg.PORT);

    std::cout << "[FWD] forwarding to " << m_cfg.HOST << ":" << m_cfg.PORT << "\n";
    return true;
}

void UdpForwarder::Stop() {
    if (m_fd >= 0) {
        ::close(m_fd);
        m_fd = -1;
    }
}

std::string UdpForwarder::formatRow(const msg::StoredReading& row) {
    const msg::RawReading& r = row.reading.reading;

    std::string s = "R,";
    s += std::to_string(row.id);
    s += ",";
    s += r.tag_id;
    for (std::size_t i = 0; i < msg::MAX_RANGE_SLOTS; ++i) {
        s += ",";
        if (msg::slotSet(r.dist_present, i)) appendNumber(s, r.dist[i]);
    }
    s += ",";
    if (r.has_span_x) appendNumber(s, r.span_x);
    s += ",";
    if (r.has_span_y) appendNumber(s, r.span_y);
    s += ",";
    s += std::to_string(r.captured_at_us);
    return s;
}

bool UdpForwarder::forward(const std::vector<msg::StoredReading>& rows) {
    if (m_fd < 0) {
        std::cerr << "[FWD] not started\n";
        return false;
    }

    sockaddr_in dest{};
    dest.sin_family = AF_INET;
    dest.sin_addr.s_addr = m_dest_addr;
    dest.sin_port = m_dest_port;

    for (const msg::StoredReading& row : rows) {
        const std::string pkt = formatRow(row);
        const ssize_t w = ::sendto(m_fd, pkt.data(), pkt.size(), 0,
                                   reinterpret_cast<const sockaddr*>(&dest), sizeof(dest));
        if (w < 0 || static_cast<size_t>(w) != pkt.size()) {
            std::cerr << "[FWD] sendto failed id=" << row.id
                      << " errno=" << errno << " " << std::strerror(errno) << "\n";
            return false;
        }
    }
    return true;
}

} // namespace platform
