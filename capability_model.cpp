#include "capability_model.h"
#include "checksum.h"
#include <nlohmann/json.hpp>

using nlohmann::json;

static const uint8_t kAllOrientations = 0x0F;

static capability_model make_cap(const char *rev, const char *desc, uint32_t w, uint32_t h,
                                 uint32_t max_payload, checksum_kind ck, bool partial, bool led,
                                 bool power, pixel_format fmt) {
  capability_model c;
  c.revision = rev;
  c.description = desc;
  c.width = w; c.height = h;
  c.orientations = kAllOrientations;
  c.max_payload = max_payload;
  c.checksum = ck;
  c.partial_update = partial;
  c.led = led;
  c.power_control = power;
  c.pixfmt = fmt;
  return c;
}

static const std::vector<capability_model> &builtin_table() {
  // Bitmap data is streamed in lines of width*8 (A, B) or width*4 (WeAct) bytes.
  // C and E slice into 249-byte pieces padded to 250-byte packets, D into 63-byte pieces behind a 0x50 prefix.
  static const std::vector<capability_model> table = {
    make_cap("A",          "Turing / UsbMonitor 3.5\"",  320,  480, 320*8, CHECKSUM_NONE,  true,  false, true,  PIXFMT_RGB565_LE),
    make_cap("A_5",        "UsbMonitor 5\"",             480,  800, 480*8, CHECKSUM_NONE,  true,  false, true,  PIXFMT_RGB565_LE),
    make_cap("A_7",        "UsbMonitor 7\"",             600, 1024, 600*8, CHECKSUM_NONE,  true,  false, true,  PIXFMT_RGB565_LE),
    make_cap("B",          "XuanFang 3.5\"",             320,  480, 320*8, CHECKSUM_NONE,  true,  false, false, PIXFMT_RGB565_BE),
    make_cap("B_FLAGSHIP", "XuanFang 3.5\" flagship",    320,  480, 320*8, CHECKSUM_NONE,  true,  true,  false, PIXFMT_RGB565_BE),
    make_cap("C",          "Turing 5\"",                 480,  800, 249,   CHECKSUM_NONE,  false, false, true,  PIXFMT_BGRA8888),
    make_cap("D",          "Kipye 3.5\"",                320,  480, 63,    CHECKSUM_NONE,  true,  false, false, PIXFMT_RGB565_BE),
    make_cap("E",          "Turing 8.8\"",               480, 1920, 249,   CHECKSUM_NONE,  false, false, true,  PIXFMT_BGRA8888),
    make_cap("WEACT_B",    "WeAct 0.96\"",                80,  160, 80*4,  CHECKSUM_NONE,  true,  false, true,  PIXFMT_RGB565_LE),
    make_cap("SIMU",       "simulated panel",              0,    0, 4096,  CHECKSUM_CRC32, true,  true,  true,  PIXFMT_BGRA8888),
  };
  return table;
}

bool capability_lookup(const std::string &revision, capability_model *out, std::string *err) {
  for (const auto &c : builtin_table()) {
    if (c.revision == revision) { *out = c; return true; }
  }
  if (err) {
    *err = "unknown revision '" + revision + "' (known:";
    for (const auto &c : builtin_table()) *err += " " + c.revision;
    *err += ")";
  }
  return false;
}

std::vector<std::string> capability_revisions() {
  std::vector<std::string> out;
  for (const auto &c : builtin_table()) out.push_back(c.revision);
  return out;
}

bool capability_apply_overrides(capability_model &c, uint32_t max_payload, const std::string &checksum, std::string *err) {
  if (max_payload) c.max_payload = max_payload;
  if (!checksum.empty()) {
    checksum_kind k;
    if (!checksum_kind_from_string(checksum, &k)) {
      if (err) *err = "invalid checksum override '" + checksum + "'";
      return false;
    }
    c.checksum = k;
  }
  if (c.max_payload == 0) {
    if (err) *err = "max payload must be > 0";
    return false;
  }
  return true;
}

std::string capability_to_json(const capability_model &c) {
  json j;
  j["revision"] = c.revision;
  j["description"] = c.description;
  j["width"] = c.width;
  j["height"] = c.height;
  json o = json::array();
  for (int i=0;i<4;i++) if (capability_supports_orientation(c, (orientation)i)) o.push_back(orientation_to_string((orientation)i));
  j["orientations"] = o;
  j["maxPayload"] = c.max_payload;
  j["checksum"] = checksum_kind_to_string(c.checksum);
  j["partialUpdate"] = c.partial_update;
  j["led"] = c.led;
  j["powerControl"] = c.power_control;
  return j.dump();
}
