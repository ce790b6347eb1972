#pragma once
#include <stdint.h>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "byte_transport.h"
#include "display_types.h"

// Opcodes of the simulated panel's wire protocol. Multi-byte fields are big-endian.
//   'H' "SIMU"          -> answers "SIMU" w h (portrait size)
//   'O' o w h           orientation and logical size
//   'L' level           brightness 0..100
//   'C' r g b           backplate LED
//   'P' on              power
//   'R'                 reset (clears to black)
//   'B' x y w h <data>  region, BGRA pixels, sliced and checksummed like any bitmap payload
//   'F' <data>          full frame
enum sim_opcode : uint8_t {
  SIM_HELLO = 'H',
  SIM_ORIENTATION = 'O',
  SIM_BRIGHTNESS = 'L',
  SIM_LED = 'C',
  SIM_POWER = 'P',
  SIM_RESET = 'R',
  SIM_REGION = 'B',
  SIM_FULL = 'F',
};

struct sim_panel_stats {
  uint64_t full_frames = 0;
  uint64_t region_frames = 0;
  uint64_t checksum_errors = 0;
  uint64_t protocol_errors = 0;
  uint64_t resets = 0;
  uint64_t hellos = 0;
  int brightness = -1;
  bool power = true;
  rgb_u8 led;
  orientation orient = ORIENT_PORTRAIT;
};

// In-memory stand-in for a panel: decodes the byte stream into a mirror of the screen.
class SimulatedPanel {
public:
  SimulatedPanel(uint32_t width, uint32_t height, uint32_t max_payload, checksum_kind checksum);

  // Device side, driven by SimulatedTransport.
  void feed(const uint8_t *data, size_t len);
  size_t takeReply(uint8_t *out, size_t len);
  // (Re)enumeration: drops any half-received command.
  void linkReset();

  sim_panel_stats stats() const;
  std::vector<std::string> events() const;
  void clearEvents();
  // Copy of the displayed image in the current logical orientation.
  void mirror(std::vector<uint32_t> &px, uint32_t *w, uint32_t *h) const;

  // Fault injection.
  void setUnplugged(bool v);
  bool unplugged() const;
  void timeoutNextWrites(int n);
  bool consumeTimeout();
  void setMute(bool v);
  // Answers HELLO but lets every other write time out.
  void setHelloOnly(bool v);
  bool acceptsWrite(const uint8_t *data, size_t len) const;

private:
  void parseLocked();
  void applyFrameLocked();

  mutable std::mutex mtx;
  uint32_t W, H;                 // portrait
  uint32_t lw, lh;               // logical
  uint32_t max_payload_;
  checksum_kind checksum_;
  std::vector<uint32_t> screen;
  std::vector<uint8_t> in;
  std::vector<uint8_t> reply;
  std::vector<std::string> log;
  sim_panel_stats st;

  bool in_payload = false;
  bool payload_full = false;
  bool payload_bad = false;
  rect_u32 target;
  size_t remaining = 0;
  std::vector<uint8_t> staging;

  bool unplugged_ = false;
  bool mute_ = false;
  bool hello_only_ = false;
  int pending_timeouts = 0;
};

class SimulatedTransport : public ByteTransport {
public:
  explicit SimulatedTransport(std::shared_ptr<SimulatedPanel> panel);

  bool open(std::string *err) override;
  void close() override { open_ = false; }
  bool isOpen() const override { return open_; }
  Io write(const uint8_t *data, size_t len, int timeout_ms) override;
  Io read(uint8_t *data, size_t len, size_t *got, int timeout_ms) override;
  void discardInput() override;
  std::string describe() const override { return "simulated"; }

private:
  std::shared_ptr<SimulatedPanel> panel_;
  bool open_ = false;
};
