#include "serial_transport.h"
#include "sys_util.h"
#include <errno.h>
#include <fcntl.h>
#include <poll.h>
#include <string.h>
#include <termios.h>
#include <unistd.h>

static speed_t baud_to_speed(int baud) {
  switch (baud) {
    case 9600:    return B9600;
    case 19200:   return B19200;
    case 38400:   return B38400;
    case 57600:   return B57600;
    case 115200:  return B115200;
    case 230400:  return B230400;
    case 460800:  return B460800;
    case 921600:  return B921600;
    default:      return 0;
  }
}

SerialTransport::SerialTransport(const std::string &path, int baud, bool rtscts)
  : path_(path), baud_(baud), rtscts_(rtscts) {}

SerialTransport::~SerialTransport() { close(); }

bool SerialTransport::open(std::string *err) {
  if (fd >= 0) return true;
  speed_t sp = baud_to_speed(baud_);
  if (!sp) {
    if (err) *err = "unsupported baud rate " + std::to_string(baud_);
    return false;
  }
  int f = ::open(path_.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK | O_CLOEXEC);
  if (f < 0) {
    if (err) *err = "open " + path_ + ": " + strerror(errno);
    return false;
  }
  struct termios tio;
  if (tcgetattr(f, &tio) != 0) {
    if (err) *err = "tcgetattr " + path_ + ": " + strerror(errno);
    ::close(f);
    return false;
  }
  cfmakeraw(&tio);
  tio.c_cflag |= (CLOCAL | CREAD);
  if (rtscts_) tio.c_cflag |= CRTSCTS;
  else tio.c_cflag &= ~CRTSCTS;
  tio.c_cflag &= ~CSTOPB;
  tio.c_cc[VMIN] = 0;
  tio.c_cc[VTIME] = 0;
  cfsetispeed(&tio, sp);
  cfsetospeed(&tio, sp);
  if (tcsetattr(f, TCSANOW, &tio) != 0) {
    if (err) *err = "tcsetattr " + path_ + ": " + strerror(errno);
    ::close(f);
    return false;
  }
  tcflush(f, TCIOFLUSH);
  fd = f;
  return true;
}

void SerialTransport::close() {
  if (fd >= 0) {
    ::close(fd);
    fd = -1;
  }
}

ByteTransport::Io SerialTransport::write(const uint8_t *data, size_t len, int timeout_ms) {
  if (fd < 0) return Io::ERROR;
  uint64_t deadline = monotonic_ms() + (uint64_t)timeout_ms;
  size_t off = 0;
  while (off < len) {
    uint64_t now = monotonic_ms();
    if (now >= deadline) return Io::TIMEOUT;
    struct pollfd p; p.fd = fd; p.events = POLLOUT; p.revents = 0;
    int r = poll(&p, 1, (int)(deadline - now));
    if (r < 0) {
      if (errno == EINTR) continue;
      return Io::ERROR;
    }
    if (r == 0) return Io::TIMEOUT;
    if (p.revents & (POLLERR | POLLHUP | POLLNVAL)) return Io::ERROR;
    ssize_t n = ::write(fd, data + off, len - off);
    if (n < 0) {
      if (errno == EAGAIN || errno == EINTR) continue;
      return Io::ERROR;
    }
    off += (size_t)n;
  }
  // Bytes are queued; wait for the UART to drain them so the next command starts clean.
  if (tcdrain(fd) != 0 && errno != EINTR) return Io::ERROR;
  return Io::OK;
}

ByteTransport::Io SerialTransport::read(uint8_t *data, size_t len, size_t *got, int timeout_ms) {
  *got = 0;
  if (fd < 0) return Io::ERROR;
  uint64_t deadline = monotonic_ms() + (uint64_t)timeout_ms;
  while (*got < len) {
    uint64_t now = monotonic_ms();
    if (now >= deadline) return Io::TIMEOUT;
    struct pollfd p; p.fd = fd; p.events = POLLIN; p.revents = 0;
    int r = poll(&p, 1, (int)(deadline - now));
    if (r < 0) {
      if (errno == EINTR) continue;
      return Io::ERROR;
    }
    if (r == 0) return Io::TIMEOUT;
    if (p.revents & (POLLERR | POLLNVAL)) return Io::ERROR;
    ssize_t n = ::read(fd, data + *got, len - *got);
    if (n < 0) {
      if (errno == EAGAIN || errno == EINTR) continue;
      return Io::ERROR;
    }
    if (n == 0) return Io::ERROR;   // hangup
    *got += (size_t)n;
  }
  return Io::OK;
}

void SerialTransport::discardInput() {
  if (fd >= 0) tcflush(fd, TCIFLUSH);
}
