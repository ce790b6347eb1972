#pragma once
#include <stddef.h>
#include <stdint.h>
#include <string>
#include <vector>
#include "display_types.h"

// 8-bit two's complement sum: the byte that makes the chunk sum to 0 mod 256.
uint8_t checksum_additive(const uint8_t *buf, size_t len);

// IEEE 802.3 / PNG CRC-32.
uint32_t checksum_crc32(const uint8_t *buf, size_t len);

// Number of trailer bytes appended per chunk (0, 1 or 4).
size_t checksum_size(checksum_kind k);

// Appends the trailer for buf[0..len) to out. CRC-32 is written big-endian.
void checksum_append(checksum_kind k, const uint8_t *buf, size_t len, std::vector<uint8_t> &out);

// Checks a chunk whose trailer is the last checksum_size(k) bytes.
bool checksum_verify(checksum_kind k, const uint8_t *buf, size_t len_with_trailer);

const char *checksum_kind_to_string(checksum_kind k);
bool checksum_kind_from_string(const std::string &s, checksum_kind *out);
