#pragma once
#include <mutex>
#include <string>

class Engine;

// Runtime commands accepted from the control server. cmd is one of
// "brightness", "orientation", "led", "power"; body is the request JSON.
// On return out_json holds {"ok":true} or {"ok":false,"status":..,"error":..}
// and out_http_status the matching HTTP code.
bool control_apply_command(Engine &engine, const std::string &cmd, const std::string &body,
                           std::string &out_json, int &out_http_status);

// Engine reference shared with the HTTP handler threads. detach() returns once no handler
// is still inside the engine, so the caller may then stop and destroy it.
class ControlTarget {
public:
  void attach(Engine *e);
  void detach();

  // "{}" while detached.
  std::string statusJson();
  // 503 while detached.
  bool apply(const std::string &cmd, const std::string &body, std::string &out_json, int &out_http_status);

private:
  std::mutex mtx_;
  Engine *engine_ = nullptr;
};
