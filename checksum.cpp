#include "checksum.h"
#include <mutex>

static uint32_t crc32_table[256];
static std::once_flag crc32_once;

static void crc32_init() {
  for (uint32_t i=0;i<256;i++){
    uint32_t c=i;
    for(int k=0;k<8;k++) c = (c&1) ? (0xEDB88320u ^ (c>>1)) : (c>>1);
    crc32_table[i]=c;
  }
}

uint8_t checksum_additive(const uint8_t *buf, size_t len) {
  uint8_t sum = 0;
  for (size_t i=0;i<len;i++) sum = (uint8_t)(sum + buf[i]);
  return (uint8_t)(0x100 - sum);
}

uint32_t checksum_crc32(const uint8_t *buf, size_t len) {
  std::call_once(crc32_once, crc32_init);
  uint32_t c=0xFFFFFFFFu;
  for (size_t i=0;i<len;i++) c = crc32_table[(c ^ buf[i]) & 0xFF] ^ (c>>8);
  return c ^ 0xFFFFFFFFu;
}

size_t checksum_size(checksum_kind k) {
  switch (k) {
    case CHECKSUM_ADDITIVE: return 1;
    case CHECKSUM_CRC32:    return 4;
    default:                return 0;
  }
}

void checksum_append(checksum_kind k, const uint8_t *buf, size_t len, std::vector<uint8_t> &out) {
  if (k == CHECKSUM_ADDITIVE) {
    out.push_back(checksum_additive(buf, len));
  } else if (k == CHECKSUM_CRC32) {
    uint32_t c = checksum_crc32(buf, len);
    out.push_back((c>>24)&0xFF); out.push_back((c>>16)&0xFF); out.push_back((c>>8)&0xFF); out.push_back(c&0xFF);
  }
}

bool checksum_verify(checksum_kind k, const uint8_t *buf, size_t len_with_trailer) {
  size_t n = checksum_size(k);
  if (n == 0) return true;
  if (len_with_trailer < n) return false;
  size_t len = len_with_trailer - n;
  if (k == CHECKSUM_ADDITIVE) return checksum_additive(buf, len) == buf[len];
  uint32_t want = ((uint32_t)buf[len]<<24) | ((uint32_t)buf[len+1]<<16) | ((uint32_t)buf[len+2]<<8) | (uint32_t)buf[len+3];
  return checksum_crc32(buf, len) == want;
}

const char *checksum_kind_to_string(checksum_kind k) {
  switch (k) {
    case CHECKSUM_ADDITIVE: return "additive";
    case CHECKSUM_CRC32:    return "crc32";
    default:                return "none";
  }
}

bool checksum_kind_from_string(const std::string &s, checksum_kind *out) {
  if (s == "none")     { *out = CHECKSUM_NONE; return true; }
  if (s == "additive") { *out = CHECKSUM_ADDITIVE; return true; }
  if (s == "crc32" || s == "crc") { *out = CHECKSUM_CRC32; return true; }
  return false;
}
