#include "control_commands.h"
#include "display_types.h"
#include "engine.h"

#include <nlohmann/json.hpp>

using nlohmann::json;

static int http_status_for(LcdStatus st) {
  switch (st) {
    case LcdStatus::OK:
    case LcdStatus::RECOVERED:             return 200;
    case LcdStatus::CONFIG_ERROR:          return 400;
    case LcdStatus::UNSUPPORTED_OPERATION: return 409;
    default:                               return 503;
  }
}

static bool reply(LcdStatus st, const std::string &err, std::string &out_json, int &out_http_status) {
  json r;
  bool ok = (st == LcdStatus::OK || st == LcdStatus::RECOVERED);
  r["ok"] = ok;
  if (!ok) {
    r["status"] = lcd_status_name(st);
    r["error"] = err;
  }
  out_json = r.dump();
  out_http_status = http_status_for(st);
  return ok;
}

static bool bad_request(const std::string &why, std::string &out_json, int &out_http_status) {
  return reply(LcdStatus::CONFIG_ERROR, why, out_json, out_http_status);
}

bool control_apply_command(Engine &engine, const std::string &cmd, const std::string &body,
                           std::string &out_json, int &out_http_status) {
  json j = json::parse(body, nullptr, false);
  if (j.is_discarded() || !j.is_object()) return bad_request("body is not a JSON object", out_json, out_http_status);

  std::string err;
  LcdStatus st;

  if (cmd == "brightness") {
    if (!j.contains("level") || !j["level"].is_number_integer()) return bad_request("expected {\"level\":0..100}", out_json, out_http_status);
    st = engine.setBrightness(j["level"].get<int>(), &err);
  } else if (cmd == "orientation") {
    orientation o;
    if (!j.contains("orientation") || !j["orientation"].is_string() ||
        !orientation_from_string(j["orientation"].get<std::string>(), &o)) {
      return bad_request("expected {\"orientation\":\"portrait|reverse_portrait|landscape|reverse_landscape\"}", out_json, out_http_status);
    }
    st = engine.setOrientation(o, &err);
  } else if (cmd == "led") {
    rgb_u8 c;
    if (!j.contains("color") || !j["color"].is_string() ||
        !parse_rgb_csv(j["color"].get<std::string>().c_str(), &c)) {
      return bad_request("expected {\"color\":\"r,g,b\"}", out_json, out_http_status);
    }
    st = engine.setLed(c, &err);
  } else if (cmd == "power") {
    if (!j.contains("on") || !j["on"].is_boolean()) return bad_request("expected {\"on\":true|false}", out_json, out_http_status);
    st = engine.power(j["on"].get<bool>(), &err);
  } else {
    return bad_request("unknown command '" + cmd + "'", out_json, out_http_status);
  }

  if (st != LcdStatus::OK) fprintf(stderr, "[control] %s: %s %s\n", cmd.c_str(), lcd_status_name(st), err.c_str());
  return reply(st, err, out_json, out_http_status);
}

void ControlTarget::attach(Engine *e) {
  std::lock_guard<std::mutex> lk(mtx_);
  engine_ = e;
}

void ControlTarget::detach() {
  std::lock_guard<std::mutex> lk(mtx_);
  engine_ = nullptr;
}

std::string ControlTarget::statusJson() {
  std::lock_guard<std::mutex> lk(mtx_);
  if (!engine_) return "{}";
  return engine_status_to_json(engine_->status());
}

bool ControlTarget::apply(const std::string &cmd, const std::string &body, std::string &out_json, int &out_http_status) {
  std::lock_guard<std::mutex> lk(mtx_);
  if (!engine_) return reply(LcdStatus::NOT_CONNECTED, "engine not ready", out_json, out_http_status);
  return control_apply_command(*engine_, cmd, body, out_json, out_http_status);
}
