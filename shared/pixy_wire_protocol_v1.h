#pragma once
// ============================================================
// PIXY OBJECT BLOCK WIRE PROTOCOL (AUTHORITATIVE CONTRACT)
// v1.0
//
// Byte-level contract between the camera and the host over
// I2C or serial. All 16-bit fields are little-endian.
//
// Frame layout:
//   SYNC SYNC CHK BODY   SYNC CHK BODY ...   SYNC SYNC CHK BODY ...
//   ^ frame start        ^ next block        ^ next frame
//
// A sync word where a checksum is expected marks end of frame.
//
// RULES:
//  - Host tools may include this file directly.
//  - Version bump required for incompatible changes.
// ============================================================

#define PIXY_WIRE_PROTOCOL_VERSION 0x00010000

// ------------------------------------------------------------
// Sync words (as read little-endian from the wire)
// ------------------------------------------------------------
typedef enum {
  PIXY_SYNC_WORD    = 0xAA55,  // plain block, wire 55 AA
  PIXY_SYNC_WORD_CC = 0xAA56,  // color-coded block, wire 56 AA
  PIXY_SYNC_WORDX   = 0x55AA   // plain sync read one byte out of phase
} pixy_sync_word_t;

typedef enum {
  PIXY_SYNC_LOW    = 0x55,
  PIXY_SYNC_LOW_CC = 0x56,
  PIXY_SYNC_HIGH   = 0xAA
} pixy_sync_byte_t;

// ------------------------------------------------------------
// Block bodies (bytes following the checksum)
//   plain:       signature centerX centerY width height
//   color-coded: signature centerX centerY width height angle
// ------------------------------------------------------------
#define PIXY_NORMAL_BODY_LEN 10
#define PIXY_CC_BODY_LEN     12

#define PIXY_SIGNATURE_MIN 1
#define PIXY_SIGNATURE_MAX 7

// ------------------------------------------------------------
// Commands (host -> camera), always prefixed with 0x00
//   LED:        00 FD R G B
//   brightness: 00 FE V
//   pan/tilt:   00 FF panL panH tiltL tiltH   (0..1000 each)
// ------------------------------------------------------------
typedef enum {
  PIXY_CMD_PREFIX         = 0x00,
  PIXY_CMD_SET_LED        = 0xFD,
  PIXY_CMD_SET_BRIGHTNESS = 0xFE,
  PIXY_CMD_SET_PAN_TILT   = 0xFF
} pixy_cmd_t;

#define PIXY_PAN_TILT_MAX 1000

// ------------------------------------------------------------
// Link defaults
// ------------------------------------------------------------
#define PIXY_DEFAULT_I2C_ADDR 0x54
#define PIXY_DEFAULT_BAUD     19200
