#pragma once
#include <cstdint>
#include <cstddef>
#include <stdexcept>
#include <string>

#include "pixy_wire_protocol_v1.h"

namespace pixy {

static constexpr uint16_t SYNC_WORD    = PIXY_SYNC_WORD;
static constexpr uint16_t SYNC_WORD_CC = PIXY_SYNC_WORD_CC;
static constexpr uint16_t SYNC_WORDX   = PIXY_SYNC_WORDX;

static constexpr uint8_t SYNC_LOW    = PIXY_SYNC_LOW;
static constexpr uint8_t SYNC_LOW_CC = PIXY_SYNC_LOW_CC;
static constexpr uint8_t SYNC_HIGH   = PIXY_SYNC_HIGH;

static constexpr size_t NORMAL_BODY_LEN = PIXY_NORMAL_BODY_LEN;
static constexpr size_t CC_BODY_LEN     = PIXY_CC_BODY_LEN;

static constexpr uint16_t SIGNATURE_MIN = PIXY_SIGNATURE_MIN;
static constexpr uint16_t SIGNATURE_MAX = PIXY_SIGNATURE_MAX;

static constexpr int PAN_TILT_MAX = PIXY_PAN_TILT_MAX;

enum : uint8_t {
  CMD_PREFIX         = PIXY_CMD_PREFIX,
  CMD_SET_LED        = PIXY_CMD_SET_LED,
  CMD_SET_BRIGHTNESS = PIXY_CMD_SET_BRIGHTNESS,
  CMD_SET_PAN_TILT   = PIXY_CMD_SET_PAN_TILT,
};

static constexpr size_t CMD_MAX_LEN = 6;

// What a pending read represents. The first group is used by the word
// decoder, the second by the byte decoder.
enum class RequestTag : uint8_t {
  NONE,

  SYNC,
  ALIGN,
  CHECKSUM,
  NORMAL_BLOCK,
  COLOR_CODE_BLOCK,

  SYNC_LOW,
  SYNC_HIGH,
  CHECKSUM_LOW,
  CHECKSUM_HIGH,
  SIGNATURE_LOW,
  SIGNATURE_HIGH,
  CENTERX_LOW,
  CENTERX_HIGH,
  CENTERY_LOW,
  CENTERY_HIGH,
  WIDTH_LOW,
  WIDTH_HIGH,
  HEIGHT_LOW,
  HEIGHT_HIGH,
  ANGLE_LOW,
  ANGLE_HIGH,
};

const char* tag_name(RequestTag tag);
bool is_word_tag(RequestTag tag);
bool is_byte_tag(RequestTag tag);

struct ObjectBlock {
  uint16_t sync = 0;
  uint16_t checksum = 0;
  uint16_t signature = 0;
  uint16_t center_x = 0;
  uint16_t center_y = 0;
  uint16_t width = 0;
  uint16_t height = 0;
  int16_t  angle = 0;       // color-coded blocks only

  bool color_coded() const { return sync == SYNC_WORD_CC; }
  std::string to_string() const;
};

bool operator==(const ObjectBlock& a, const ObjectBlock& b);
inline bool operator!=(const ObjectBlock& a, const ObjectBlock& b) { return !(a == b); }

// A read completion the decoder's own request chain cannot produce.
class ProtocolViolation : public std::logic_error {
public:
  using std::logic_error::logic_error;
};

static inline uint16_t make_word(uint8_t low, uint8_t high) {
  return (uint16_t)((uint16_t)low | ((uint16_t)high << 8));
}

static inline uint16_t rd16_le(const uint8_t* p) {
  return make_word(p[0], p[1]);
}

static inline void wr16_le(uint8_t* p, uint16_t v) {
  p[0] = (uint8_t)(v & 0xFF);
  p[1] = (uint8_t)((v >> 8) & 0xFF);
}

bool is_sync_word(uint16_t word);

// Body length announced by a sync word, 0 if the word is not a sync.
size_t body_length(uint16_t sync);

// Command builders return the command length, or 0 if out_max is too small.
size_t build_set_led(uint8_t* out, size_t out_max, uint8_t red, uint8_t green, uint8_t blue);
size_t build_set_brightness(uint8_t* out, size_t out_max, uint8_t brightness);

// Throws std::invalid_argument if pan or tilt is outside [0, PAN_TILT_MAX].
size_t build_set_pan_tilt(uint8_t* out, size_t out_max, int pan, int tilt);

} // namespace pixy
