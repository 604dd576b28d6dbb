/* @file SerialChannel.cpp
 * @brief IO abstraction layer that wraps ttyUSBx - handles file descriptor, framing, line io and RAII - POSIX compliant
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstddef>
#include <cstring> // for strerror
#include <string>

// Linux headers
#include <errno.h> // Error integer and strerror() function
#include <fcntl.h> // Contains file controls like O_RDWR
#include <poll.h>
#include <unistd.h> // write(), close()

// 3rd-party headers
#include <boost/asio/buffer.hpp>
#include <boost/asio/error.hpp>

// GeoEdge headers
#include "core/Logger.hpp"
#include "io/SerialChannel.hpp"

using namespace geoedge::io;

namespace {
  constexpr const char* kTag = "SerialChannel";
  constexpr int kWritePollMs = 100;

  std::string errnoText(const char* call) {
    return std::string("Error ") + std::to_string(errno) + " from " + call + ": " +
           strerror(errno);
  }
} // namespace

SerialChannel::SerialChannel(boost::asio::io_context& io, core::Logger& log)
    : log_(log), stream_(io) {}

SerialChannel::~SerialChannel() { close(); }

bool SerialChannel::open(const std::string& dev, speed_t baud) {
  close();

  // open non-blocking, dont become ctrl-TTY
  int fd = ::open(dev.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK);
  if (fd < 0) {
    log_.error(kTag, errnoText("open") + " (" + dev + ")");
    return false;
  }

  // fetch current attrs
  struct termios tty;
  if (tcgetattr(fd, &tty) != 0) {
    log_.error(kTag, errnoText("tcgetattr"));
    ::close(fd);
    return false;
  }

  cfmakeraw(&tty);
  tty.c_cflag &= ~CSIZE;
  tty.c_cflag |= CS8 | CLOCAL | CREAD;
  tty.c_cflag &= ~CRTSCTS;
  tty.c_iflag &= ~(IXON | IXOFF | IXANY);

  cfsetispeed(&tty, baud);
  cfsetospeed(&tty, baud);

  if (tcsetattr(fd, TCSANOW, &tty) != 0) {
    log_.error(kTag, errnoText("tcsetattr"));
    ::close(fd);
    return false;
  }

  boost::system::error_code ec;
  stream_.assign(fd, ec);
  if (ec) {
    log_.error(kTag, "assign: " + ec.message());
    ::close(fd);
    return false;
  }
  rx_buffer_.clear();
  log_.debug(kTag, "opened " + dev);
  return true;
}

bool SerialChannel::writeLine(const std::string& line) {

  if (!stream_.is_open()) {
    return false;
  }

  std::string out = line;
  if (!out.ends_with("\r\n")) {
    out += "\r\n";
  }

  const int fd = stream_.native_handle();
  std::size_t total = 0;
  while (total < out.size()) {
    ssize_t written = ::write(fd, out.data() + total, out.size() - total);
    if (written > 0) {
      total += written;
    } else if (written == -1 && errno == EINTR) {
      continue; // try again
    } else if (written == -1 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
      pollfd pfd{ fd, POLLOUT, 0 };
      if (::poll(&pfd, 1, kWritePollMs) < 0 && errno != EINTR) {
        log_.error(kTag, errnoText("poll"));
        return false;
      }
    } else {
      log_.error(kTag, errnoText("write"));
      return false;
    }
  }

  return true;
}

void SerialChannel::startReading(LineHandler onLine) {
  onLine_ = std::move(onLine);
  readSome();
}

void SerialChannel::close() {
  if (stream_.is_open()) {
    boost::system::error_code ec;
    stream_.cancel(ec);
    stream_.close(ec);
  }
}

std::optional<speed_t> SerialChannel::toSpeed(int baud) {
  switch (baud) {
  case 9600:
    return B9600;
  case 19200:
    return B19200;
  case 38400:
    return B38400;
  case 57600:
    return B57600;
  case 115200:
    return B115200;
  case 230400:
    return B230400;
  case 460800:
    return B460800;
  case 921600:
    return B921600;
  default:
    return std::nullopt;
  }
}

// -------------------------------------------------------------------
// SerialChannel::readSome
// Re-arms itself after every chunk until the channel is closed or fails.
// -------------------------------------------------------------------
void SerialChannel::readSome() {
  if (!stream_.is_open())
    return;

  stream_.async_read_some(boost::asio::buffer(rx_chunk_),
                          [this](const boost::system::error_code& ec, std::size_t n) {
                            if (ec) {
                              if (ec != boost::asio::error::operation_aborted)
                                log_.error(kTag, "read: " + ec.message());
                              return;
                            }
                            consume(rx_chunk_.data(), n);
                            readSome();
                          });
}

void SerialChannel::consume(const char* data, std::size_t n) {
  rx_buffer_.append(data, n);

  // Check for complete lines
  std::size_t pos;
  while ((pos = rx_buffer_.find("\r\n")) != std::string::npos) {
    std::string line = rx_buffer_.substr(0, pos);
    rx_buffer_.erase(0, pos + 2); // remove line + CRLF
    if (onLine_ && !line.empty())
      onLine_(line);
  }
}
