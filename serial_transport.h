#pragma once
#include <string>
#include "byte_transport.h"

// termios-backed serial port in raw 8N1 mode.
class SerialTransport : public ByteTransport {
public:
  SerialTransport(const std::string &path, int baud, bool rtscts);
  ~SerialTransport() override;

  SerialTransport(const SerialTransport&) = delete;
  SerialTransport& operator=(const SerialTransport&) = delete;

  bool open(std::string *err) override;
  void close() override;
  bool isOpen() const override { return fd >= 0; }

  Io write(const uint8_t *data, size_t len, int timeout_ms) override;
  Io read(uint8_t *data, size_t len, size_t *got, int timeout_ms) override;
  void discardInput() override;

  std::string describe() const override { return path_; }

private:
  std::string path_;
  int baud_ = 115200;
  bool rtscts_ = true;
  int fd = -1;
};
