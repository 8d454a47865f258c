#include <cstdio>
#include <cstdint>
#include <unistd.h>
#include <memory>
#include <string>
#include <vector>
#include "config.hpp"
#include "log.hpp"
#include "pixy_cam.hpp"

using namespace pixy;

static void print_batch(uint32_t frame_no, const std::vector<ObjectBlock>& batch) {
  std::printf("frame %u: %zu block(s)\n", frame_no, batch.size());
  for (size_t i = 0; i < batch.size(); ++i) {
    std::printf("  [%02zu] %s\n", i, batch[i].to_string().c_str());
  }
  std::fflush(stdout);
}

int main(int argc, char** argv) {
  PixyConfig cfg = load_config();
  if (argc >= 2) set_device_path(cfg, argv[1]);
  set_log_level(cfg.log_level);

  std::string err;
  std::unique_ptr<SerialBusDevice> bus = open_transport(cfg, err);
  if (!bus) {
    std::fprintf(stderr, "Failed to open %s device %s: %s\n",
                 transport_kind_name(cfg.transport), device_path(cfg).c_str(), err.c_str());
    return 1;
  }
  std::printf("pixy_daemon reading %s %s (%s framing)\n",
              transport_kind_name(cfg.transport), device_path(cfg).c_str(), framing_name(cfg.framing));

  PixyCam cam(cfg.name, *bus, cfg.framing, cfg.write_mode);
  cam.set_enabled(true);

  uint32_t frame_no = 0;
  std::vector<ObjectBlock> batch;
  while (!cam.faulted()) {
    if (cam.poll_batch(batch)) {
      print_batch(++frame_no, batch);
      continue;
    }
    usleep(20000);
  }

  std::fprintf(stderr, "pixy_daemon: %s halted: %s\n", cam.name().c_str(), cam.last_error().c_str());
  bus->shutdown();
  return 2;
}
