#include "../src/config.hpp"
#include "../src/log.hpp"
#include "../src/pixy_cam.hpp"
#include <cerrno>
#include <climits>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <stdexcept>
#include <string>

using namespace pixy;

static void usage() {
  std::fprintf(stderr,
               "Usage: pixy_cli led <r> <g> <b> [device]\n"
               "       pixy_cli brightness <value> [device]\n"
               "       pixy_cli pantilt <pan> <tilt> [device]\n");
}

static bool parse_int(const char* s, long& out) {
  char* end = nullptr;
  errno = 0;
  out = std::strtol(s, &end, 0);
  return errno == 0 && end != s && *end == '\0';
}

static bool parse_byte(const char* s, uint8_t& out) {
  long v = 0;
  if (!parse_int(s, v) || v < 0 || v > 255) return false;
  out = (uint8_t)v;
  return true;
}

int main(int argc, char** argv) {
  if (argc < 3) { usage(); return 2; }

  const std::string cmd = argv[1];
  int nargs = 0;
  if (cmd == "led") nargs = 3;
  else if (cmd == "brightness") nargs = 1;
  else if (cmd == "pantilt") nargs = 2;
  else { usage(); return 2; }

  if (argc < 2 + nargs) { usage(); return 2; }

  PixyConfig cfg = load_config();
  if (argc > 2 + nargs) set_device_path(cfg, argv[2 + nargs]);
  set_log_level(cfg.log_level);

  uint8_t rgb[3] = {0, 0, 0};
  long pan = 0;
  long tilt = 0;
  if (cmd == "led" || cmd == "brightness") {
    for (int i = 0; i < nargs; ++i) {
      if (!parse_byte(argv[2 + i], rgb[i])) {
        std::fprintf(stderr, "Bad value: %s (expected 0..255)\n", argv[2 + i]);
        return 2;
      }
    }
  } else if (!parse_int(argv[2], pan) || !parse_int(argv[3], tilt) ||
             pan < INT_MIN || pan > INT_MAX || tilt < INT_MIN || tilt > INT_MAX) {
    std::fprintf(stderr, "Bad pan/tilt value\n");
    return 2;
  }

  std::string err;
  std::unique_ptr<SerialBusDevice> bus = open_transport(cfg, err);
  if (!bus) {
    std::fprintf(stderr, "Failed to open %s: %s\n", device_path(cfg).c_str(), err.c_str());
    return 1;
  }

  PixyCam cam(cfg.name, *bus, cfg.framing, cfg.write_mode);
  try {
    if (cmd == "led") cam.set_led(rgb[0], rgb[1], rgb[2]);
    else if (cmd == "brightness") cam.set_brightness(rgb[0]);
    else cam.set_pan_tilt((int)pan, (int)tilt);
  } catch (const std::invalid_argument& e) {
    std::fprintf(stderr, "%s\n", e.what());
    bus->shutdown();
    return 2;
  }

  // Commands are queued; enable the bus only long enough to flush them.
  bus->set_enabled(true);
  const bool flushed = bus->wait_idle(1000);
  bus->shutdown();
  if (!flushed) {
    std::fprintf(stderr, "Timed out writing to %s\n", device_path(cfg).c_str());
    return 1;
  }
  if (bus->write_failures() > 0) {
    std::fprintf(stderr, "Write to %s failed: %s\n", device_path(cfg).c_str(), bus->last_error().c_str());
    return 1;
  }

  std::printf("sent %s to %s\n", cmd.c_str(), device_path(cfg).c_str());
  return 0;
}
