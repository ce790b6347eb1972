#pragma once
#include <stdint.h>
#include <functional>
#include <memory>
#include <string>
#include <vector>
#include "byte_transport.h"
#include "capability_model.h"
#include "display_types.h"
#include "lcd_codec.h"

class SimulatedPanel;

struct session_opts {
  int write_timeout_ms = 1000;
  int read_timeout_ms = 1000;
  int handshake_timeout_ms = 1000;
  // Attempts per write, the first one included. Only timeouts are retried.
  int write_attempts = 2;
  // Sleep used for codec delays and reopen settling.
  std::function<void(uint32_t)> sleep_fn;
};

// Connection to one panel. Exactly one thread may drive a session.
//
// Disconnected -> Handshaking -> Ready -> {Sending -> Ready} -> ErrorRecovery -> {Ready | Disconnected}
//
// A write that keeps timing out escalates to ErrorRecovery, which runs the revision's reset once.
// A successful reset returns RECOVERED (the frame was not delivered, the link is fine);
// a failed one closes the transport and returns CONNECTION_LOST.
class ProtocolSession {
public:
  enum class State {
    DISCONNECTED = 0,
    HANDSHAKING = 1,
    READY = 2,
    SENDING = 3,
    ERROR_RECOVERY = 4,
  };

  ProtocolSession(const capability_model &cap, std::unique_ptr<LcdCodec> codec,
                  std::unique_ptr<ByteTransport> transport, const session_opts &opts);
  ~ProtocolSession();

  ProtocolSession(const ProtocolSession&) = delete;
  ProtocolSession& operator=(const ProtocolSession&) = delete;

  // Opens the transport and runs the identification handshake. No retry at this level.
  LcdStatus connect(std::string *err);

  // region in logical canvas coordinates, px is region.w * region.h XRGB8888.
  LcdStatus sendFrame(const rect_u32 &region, const uint32_t *px, std::string *err);
  LcdStatus sendFullFrame(const uint32_t *px, std::string *err);

  LcdStatus setBrightness(int level, std::string *err);
  LcdStatus setLed(const rgb_u8 &color, std::string *err);
  LcdStatus power(bool on, std::string *err);
  LcdStatus setOrientation(orientation o, std::string *err);
  LcdStatus reset(std::string *err);
  void close();

  State state() const { return state_; }
  bool isReady() const { return state_ == State::READY; }
  const capability_model &capability() const { return cap_; }
  const device_info &device() const { return ctx_.info; }
  orientation currentOrientation() const { return ctx_.orient; }
  int brightness() const { return ctx_.brightness; }
  rgb_u8 ledColor() const { return led_; }
  bool powered() const { return powered_; }
  uint64_t recoveries() const { return recoveries_; }

  // Observes every state transition (tests, status reporting).
  void setStateListener(std::function<void(State)> fn) { listener_ = std::move(fn); }

private:
  void setState(State s);
  ByteTransport::Io writeWithRetry(const uint8_t *data, size_t len);
  LcdStatus runPlan(const io_plan &plan, int read_timeout_ms, std::string *err);
  LcdStatus perform(const io_plan &plan, const char *what, std::string *err);
  LcdStatus recover(const char *what, std::string *err);
  void pause(uint32_t ms);

  capability_model cap_;
  std::unique_ptr<LcdCodec> codec_;
  std::unique_ptr<ByteTransport> t_;
  session_opts opts_;
  lcd_ctx ctx_;
  State state_ = State::DISCONNECTED;
  std::function<void(State)> listener_;
  std::vector<uint8_t> last_read_;
  rgb_u8 led_;
  bool powered_ = true;
  uint64_t recoveries_ = 0;
};

const char *session_state_name(ProtocolSession::State s);

// Builds the transport for a capability (serial port, or the simulated panel for SIMU) and
// connects. Returns null with *st set on failure.
std::unique_ptr<ProtocolSession> session_connect(const capability_model &cap, const std::string &port, int baud,
                                                 bool rtscts, const session_opts &opts,
                                                 std::shared_ptr<SimulatedPanel> sim_panel,
                                                 LcdStatus *st, std::string *err);
