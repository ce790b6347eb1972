#pragma once
#include <stddef.h>
#include <stdint.h>
#include <string>

// Byte-oriented duplex channel owned by exactly one ProtocolSession.
class ByteTransport {
public:
  enum class Io {
    OK = 0,
    TIMEOUT = 1,
    ERROR = 2,
  };

  virtual ~ByteTransport() {}

  virtual bool open(std::string *err) = 0;
  virtual void close() = 0;
  virtual bool isOpen() const = 0;

  // Writes all of data or fails. A TIMEOUT may leave part of it on the wire.
  virtual Io write(const uint8_t *data, size_t len, int timeout_ms) = 0;

  // Reads up to len bytes, returning OK with *got == len, or TIMEOUT with what arrived.
  virtual Io read(uint8_t *data, size_t len, size_t *got, int timeout_ms) = 0;

  // Drops anything pending in the input buffer.
  virtual void discardInput() = 0;

  virtual std::string describe() const = 0;
};
