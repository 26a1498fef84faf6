// Copyright 2026 bburda
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "ap_onboard/discovery/udp_broadcast_transport.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

namespace ap_onboard {
namespace discovery {

namespace {

std::string errno_message(const std::string & what) {
  return what + ": " + std::strerror(errno);
}

}  // namespace

UdpBroadcastTransport::UdpBroadcastTransport(std::chrono::milliseconds receive_timeout)
  : receive_timeout_(receive_timeout) {
}

UdpBroadcastTransport::~UdpBroadcastTransport() {
  close();
}

tl::expected<void, ScanError> UdpBroadcastTransport::open() {
  close();

  fd_ = ::socket(AF_INET, SOCK_DGRAM, IPPROTO_UDP);
  if (fd_ < 0) {
    return tl::make_unexpected(ScanError{ScanErrorCode::SocketCreate, errno_message("Failed to create socket")});
  }

  int enable = 1;
  if (::setsockopt(fd_, SOL_SOCKET, SO_BROADCAST, &enable, sizeof(enable)) < 0) {
    auto error = ScanError{ScanErrorCode::SocketOption, errno_message("Failed to enable broadcast")};
    close();
    return tl::make_unexpected(error);
  }

  timeval tv{};
  tv.tv_sec = static_cast<time_t>(receive_timeout_.count() / 1000);
  tv.tv_usec = static_cast<suseconds_t>((receive_timeout_.count() % 1000) * 1000);
  if (::setsockopt(fd_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) < 0) {
    auto error = ScanError{ScanErrorCode::SocketOption, errno_message("Failed to set timeout")};
    close();
    return tl::make_unexpected(error);
  }

  sockaddr_in bind_addr{};
  bind_addr.sin_family = AF_INET;
  bind_addr.sin_addr.s_addr = htonl(INADDR_ANY);
  bind_addr.sin_port = htons(0);
  if (::bind(fd_, reinterpret_cast<sockaddr *>(&bind_addr), sizeof(bind_addr)) < 0) {
    auto error = ScanError{ScanErrorCode::Bind, errno_message("Failed to bind socket")};
    close();
    return tl::make_unexpected(error);
  }

  return {};
}

tl::expected<void, ScanError> UdpBroadcastTransport::send_broadcast(const std::vector<uint8_t> & payload,
                                                                    uint16_t port) {
  if (fd_ < 0) {
    return tl::make_unexpected(ScanError{ScanErrorCode::Send, "Failed to send discovery packet: socket not open"});
  }

  sockaddr_in dest{};
  dest.sin_family = AF_INET;
  dest.sin_addr.s_addr = htonl(INADDR_BROADCAST);
  dest.sin_port = htons(port);

  ssize_t sent = ::sendto(fd_, payload.data(), payload.size(), 0, reinterpret_cast<sockaddr *>(&dest), sizeof(dest));
  if (sent < 0 || static_cast<size_t>(sent) != payload.size()) {
    return tl::make_unexpected(ScanError{ScanErrorCode::Send, errno_message("Failed to send discovery packet")});
  }
  return {};
}

ReceiveResult UdpBroadcastTransport::receive(uint8_t * buffer, size_t capacity, std::chrono::milliseconds wait) {
  ReceiveResult result;
  if (fd_ < 0) {
    result.status = ReceiveStatus::Error;
    result.error = "socket not open";
    return result;
  }

  pollfd pfd{};
  pfd.fd = fd_;
  pfd.events = POLLIN;
  int ready = ::poll(&pfd, 1, static_cast<int>(wait.count()));
  if (ready == 0) {
    result.status = ReceiveStatus::Timeout;
    return result;
  }
  if (ready < 0) {
    if (errno == EINTR) {
      result.status = ReceiveStatus::Interrupted;
      return result;
    }
    result.status = ReceiveStatus::Error;
    result.error = errno_message("poll failed");
    return result;
  }

  sockaddr_in source{};
  socklen_t source_len = sizeof(source);
  ssize_t received =
      ::recvfrom(fd_, buffer, capacity, MSG_DONTWAIT, reinterpret_cast<sockaddr *>(&source), &source_len);
  if (received < 0) {
    if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
      // poll reported readiness but the datagram was dropped before we read it
      result.status = ReceiveStatus::Interrupted;
    } else {
      result.status = ReceiveStatus::Error;
      result.error = errno_message("recvfrom failed");
    }
    return result;
  }

  char address[INET_ADDRSTRLEN] = {0};
  if (::inet_ntop(AF_INET, &source.sin_addr, address, sizeof(address)) == nullptr) {
    result.source_ip = "unknown";
  } else {
    result.source_ip = address;
  }

  result.status = ReceiveStatus::Datagram;
  result.size = static_cast<size_t>(received);
  return result;
}

void UdpBroadcastTransport::close() {
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
}

}  // namespace discovery
}  // namespace ap_onboard
