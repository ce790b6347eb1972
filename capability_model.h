#pragma once
#include <stdint.h>
#include <string>
#include <vector>
#include "display_types.h"

// Static description of one hardware revision. Resolution is the portrait (native) size.
struct capability_model {
  std::string revision;
  std::string description;
  uint32_t width = 0, height = 0;
  uint8_t orientations = 0;            // bit (1 << orientation)
  uint32_t max_payload = 0;            // bytes per sub-write of bitmap data
  checksum_kind checksum = CHECKSUM_NONE;
  bool partial_update = true;
  bool led = false;
  bool power_control = false;
  pixel_format pixfmt = PIXFMT_RGB565_LE;
  int baud = 115200;
};

bool capability_lookup(const std::string &revision, capability_model *out, std::string *err);
std::vector<std::string> capability_revisions();

static inline bool capability_supports_orientation(const capability_model &c, orientation o) {
  return (c.orientations & (1u << (unsigned)o)) != 0;
}

// Logical canvas size for an orientation.
static inline void capability_logical_size(const capability_model &c, orientation o, uint32_t *w, uint32_t *h) {
  if (orientation_is_landscape(o)) { *w = c.height; *h = c.width; }
  else { *w = c.width; *h = c.height; }
}

// Firmware-variant overrides from the engine configuration. Zero / empty keeps the built-in value.
bool capability_apply_overrides(capability_model &c, uint32_t max_payload, const std::string &checksum, std::string *err);

std::string capability_to_json(const capability_model &c);
