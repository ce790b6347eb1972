#pragma once
#include <stdint.h>
#include <vector>

// XRGB8888 (B,G,R,X in memory) to JPEG. pitch in bytes.
bool encode_xrgb_to_jpeg(const uint32_t *px, int w, int h, int pitch, int quality, std::vector<uint8_t> &out_jpeg);
