#include "protocol.hpp"
#include <cstdio>
#include <cstring>

namespace pixy {

const char* tag_name(RequestTag tag) {
  switch (tag) {
    case RequestTag::NONE: return "NONE";
    case RequestTag::SYNC: return "SYNC";
    case RequestTag::ALIGN: return "ALIGN";
    case RequestTag::CHECKSUM: return "CHECKSUM";
    case RequestTag::NORMAL_BLOCK: return "NORMAL_BLOCK";
    case RequestTag::COLOR_CODE_BLOCK: return "COLOR_CODE_BLOCK";
    case RequestTag::SYNC_LOW: return "SYNC_LOW";
    case RequestTag::SYNC_HIGH: return "SYNC_HIGH";
    case RequestTag::CHECKSUM_LOW: return "CHECKSUM_LOW";
    case RequestTag::CHECKSUM_HIGH: return "CHECKSUM_HIGH";
    case RequestTag::SIGNATURE_LOW: return "SIGNATURE_LOW";
    case RequestTag::SIGNATURE_HIGH: return "SIGNATURE_HIGH";
    case RequestTag::CENTERX_LOW: return "CENTERX_LOW";
    case RequestTag::CENTERX_HIGH: return "CENTERX_HIGH";
    case RequestTag::CENTERY_LOW: return "CENTERY_LOW";
    case RequestTag::CENTERY_HIGH: return "CENTERY_HIGH";
    case RequestTag::WIDTH_LOW: return "WIDTH_LOW";
    case RequestTag::WIDTH_HIGH: return "WIDTH_HIGH";
    case RequestTag::HEIGHT_LOW: return "HEIGHT_LOW";
    case RequestTag::HEIGHT_HIGH: return "HEIGHT_HIGH";
    case RequestTag::ANGLE_LOW: return "ANGLE_LOW";
    case RequestTag::ANGLE_HIGH: return "ANGLE_HIGH";
  }
  return "(unknown)";
}

bool is_word_tag(RequestTag tag) {
  return tag >= RequestTag::SYNC && tag <= RequestTag::COLOR_CODE_BLOCK;
}

bool is_byte_tag(RequestTag tag) {
  return tag >= RequestTag::SYNC_LOW && tag <= RequestTag::ANGLE_HIGH;
}

std::string ObjectBlock::to_string() const {
  char buf[160];
  std::snprintf(buf, sizeof(buf),
                "sync=0x%04x, chksum=0x%04x, sig=%u, centerX=%3u, centerY=%3u, width=%3u, height=%3u, angle=%3d",
                (unsigned)sync, (unsigned)checksum, (unsigned)signature, (unsigned)center_x,
                (unsigned)center_y, (unsigned)width, (unsigned)height, (int)angle);
  return std::string(buf);
}

bool operator==(const ObjectBlock& a, const ObjectBlock& b) {
  return a.sync == b.sync && a.checksum == b.checksum && a.signature == b.signature &&
         a.center_x == b.center_x && a.center_y == b.center_y &&
         a.width == b.width && a.height == b.height && a.angle == b.angle;
}

bool is_sync_word(uint16_t word) {
  return word == SYNC_WORD || word == SYNC_WORD_CC;
}

size_t body_length(uint16_t sync) {
  if (sync == SYNC_WORD) return NORMAL_BODY_LEN;
  if (sync == SYNC_WORD_CC) return CC_BODY_LEN;
  return 0;
}

size_t build_set_led(uint8_t* out, size_t out_max, uint8_t red, uint8_t green, uint8_t blue) {
  const size_t total = 5;
  if (out_max < total) return 0;

  out[0] = CMD_PREFIX;
  out[1] = CMD_SET_LED;
  out[2] = red;
  out[3] = green;
  out[4] = blue;
  return total;
}

size_t build_set_brightness(uint8_t* out, size_t out_max, uint8_t brightness) {
  const size_t total = 3;
  if (out_max < total) return 0;

  out[0] = CMD_PREFIX;
  out[1] = CMD_SET_BRIGHTNESS;
  out[2] = brightness;
  return total;
}

size_t build_set_pan_tilt(uint8_t* out, size_t out_max, int pan, int tilt) {
  if (pan < 0 || pan > PAN_TILT_MAX || tilt < 0 || tilt > PAN_TILT_MAX) {
    char msg[96];
    std::snprintf(msg, sizeof(msg), "pan/tilt out of range [0,%d]: pan=%d tilt=%d",
                  PAN_TILT_MAX, pan, tilt);
    throw std::invalid_argument(msg);
  }

  const size_t total = 6;
  if (out_max < total) return 0;

  out[0] = CMD_PREFIX;
  out[1] = CMD_SET_PAN_TILT;
  wr16_le(out + 2, (uint16_t)pan);
  wr16_le(out + 4, (uint16_t)tilt);
  return total;
}

} // namespace pixy
