#include <atomic>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <string>
#include <vector>

#include "capability_model.h"
#include "control_commands.h"
#include "control_server.h"
#include "engine.h"
#include "engine_config.h"
#include "jpeg_encode.h"
#include "stat_sources.h"
#include "sys_util.h"
#include "theme.h"

static std::atomic<bool> g_quit{false};
static ControlTarget g_target;

static void on_signal(int) { g_quit.store(true); }

static std::string status_json() { return g_target.statusJson(); }

static bool command_handler(const std::string &cmd, const std::string &body, std::string &out_json, int &out_http_status) {
  return g_target.apply(cmd, body, out_json, out_http_status);
}

static void usage(const char *argv0) {
  std::string revs;
  for (const std::string &r : capability_revisions()) revs += (revs.empty() ? "" : "|") + r;
  fprintf(stderr,
    "Usage: %s [--config PATH] [--theme PATH] [--revision %s] [--port /dev/ttyACM0]\n"
    "          [--brightness 0..100] [--reverse] [--no-control] [--control-port N] [--listen ADDR]\n"
    "          [--write-config PATH]\n",
    argv0, revs.c_str()
  );
}

int main(int argc, char **argv) {
  std::string cfg_path;
  std::string write_cfg_path;

  for (int i=1;i<argc;i++) {
    if (strcmp(argv[i],"--config")==0 && i+1<argc) cfg_path=argv[++i];
  }

  engine_cfg cfg;
  if (!cfg_path.empty()) {
    std::string err;
    if (!engine_cfg_load(cfg_path, cfg, &err)) {
      fprintf(stderr, "[config] %s\n", err.c_str());
      return 2;
    }
  }

  for (int i=1;i<argc;i++) {
    const char *a = argv[i];
    if (strcmp(a,"--config")==0 && i+1<argc) { ++i; }
    else if (strcmp(a,"--theme")==0 && i+1<argc) cfg.theme_path=argv[++i];
    else if (strcmp(a,"--revision")==0 && i+1<argc) cfg.revision=argv[++i];
    else if (strcmp(a,"--port")==0 && i+1<argc) cfg.port=argv[++i];
    else if (strcmp(a,"--brightness")==0 && i+1<argc) cfg.brightness=atoi(argv[++i]);
    else if (strcmp(a,"--reverse")==0) cfg.reverse_orientation=true;
    else if (strcmp(a,"--no-control")==0) cfg.control_enable=false;
    else if (strcmp(a,"--control-port")==0 && i+1<argc) cfg.control_port=atoi(argv[++i]);
    else if (strcmp(a,"--listen")==0 && i+1<argc) cfg.listen_addr=argv[++i];
    else if (strcmp(a,"--write-config")==0 && i+1<argc) write_cfg_path=argv[++i];
    else if (strcmp(a,"-h")==0 || strcmp(a,"--help")==0) { usage(argv[0]); return 0; }
    else { usage(argv[0]); return 2; }
  }
  engine_cfg_normalize(cfg);

  if (!write_cfg_path.empty()) {
    if (!write_file_atomic(write_cfg_path, engine_cfg_to_json(cfg) + "\n")) {
      fprintf(stderr, "[config] cannot write %s\n", write_cfg_path.c_str());
      return 1;
    }
    fprintf(stderr, "[config] wrote %s\n", write_cfg_path.c_str());
    return 0;
  }

  if (cfg.theme_path.empty()) {
    fprintf(stderr, "[main] no theme given (--theme or \"theme\" in the config)\n");
    usage(argv[0]);
    return 2;
  }

  std::string err;
  capability_model cap;
  if (!capability_lookup(cfg.revision, &cap, &err) ||
      !capability_apply_overrides(cap, cfg.max_payload, cfg.checksum, &err)) {
    fprintf(stderr, "[main] %s\n", err.c_str());
    return 2;
  }

  theme th;
  if (!theme_load(cfg.theme_path, &th, &err)) {
    fprintf(stderr, "[theme] %s\n", err.c_str());
    return 2;
  }

  Engine engine;
  if (!cfg.static_stats.empty()) {
    engine.addStatSource(std::make_shared<StaticStatSource>(cfg.static_stats, cfg.static_interval_ms));
  }
  if (!cfg.random_stats.empty()) {
    engine.addStatSource(std::make_shared<RandomStatSource>(cfg.random_stats, cfg.random_interval_ms, cfg.random_seed));
  }
  if (cfg.clock_stats) engine.addStatSource(std::make_shared<ClockStatSource>());

  if (cfg.control_enable && cfg.preview_fps > 0) {
    const int quality = cfg.jpeg_quality;
    engine.setFrameListener([quality](const std::vector<uint32_t> &px, uint32_t w, uint32_t h) {
      std::vector<uint8_t> jpg;
      if (encode_xrgb_to_jpeg(px.data(), (int)w, (int)h, (int)(w * 4), quality, jpg)) {
        control_publish_frame(std::move(jpg));
      }
    });
  }

  if (!engine.start(th, cap, cfg.port, engine_opts_from_cfg(cfg), &err)) {
    fprintf(stderr, "[main] cannot start: %s\n", err.c_str());
    return 2;
  }
  g_target.attach(&engine);

  std::signal(SIGINT, on_signal);
  std::signal(SIGTERM, on_signal);

  if (cfg.control_enable) {
    control_set_status_provider(&status_json);
    control_set_command_handler(&command_handler);
    control_set_quit_flag(&g_quit);
    control_set_listen_address(cfg.listen_addr);
    control_start_detached(cfg.control_port);
    fprintf(stderr, "[control] open http://%s:%d/\n", cfg.listen_addr.c_str(), cfg.control_port);
  }

  while (!g_quit.load()) sleep_ms(100);

  fprintf(stderr, "[main] shutting down...\n");
  // No handler touches the engine past this point.
  g_target.detach();
  engine.stop();
  return 0;
}
