#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdio>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <httplib.h>
#include "control_server.h"

static std::mutex g_mtx;

static std::string (*g_status)() = nullptr;
static bool (*g_command)(const std::string&, const std::string&, std::string&, int&) = nullptr;
static std::atomic<bool> *g_quit = nullptr;
static std::string g_listen_addr = "127.0.0.1";

static std::mutex g_frame_mtx;
static std::condition_variable g_frame_cv;
static std::vector<uint8_t> g_current_frame;
static uint64_t g_frame_sequence = 0;

void control_set_status_provider(std::string (*fn)()) {
  std::lock_guard<std::mutex> lk(g_mtx);
  g_status = fn;
}
void control_set_command_handler(bool (*fn)(const std::string&, const std::string&, std::string&, int&)) {
  std::lock_guard<std::mutex> lk(g_mtx);
  g_command = fn;
}
void control_set_quit_flag(std::atomic<bool> *quit_flag) {
  std::lock_guard<std::mutex> lk(g_mtx);
  g_quit = quit_flag;
}
void control_set_listen_address(const std::string &addr) {
  std::lock_guard<std::mutex> lk(g_mtx);
  g_listen_addr = addr;
}

void control_publish_frame(std::vector<uint8_t> jpeg) {
  {
    std::lock_guard<std::mutex> lk(g_frame_mtx);
    g_current_frame.swap(jpeg);
    g_frame_sequence++;
  }
  g_frame_cv.notify_all();
}

static bool quit_requested() {
  std::lock_guard<std::mutex> lk(g_mtx);
  return g_quit && g_quit->load();
}

static inline void set_no_cache_headers(httplib::Response &res) {
  res.set_header("Cache-Control", "no-store, no-cache, must-revalidate, max-age=0");
  res.set_header("Pragma", "no-cache");
  res.set_header("Expires", "0");
  res.set_header("X-Accel-Buffering", "no");
}

static const char *kIndexHtml = R"HTML(<!doctype html>
<html>
<head>
  <meta charset="utf-8"/>
  <meta name="viewport" content="width=device-width,initial-scale=1"/>
  <title>Smart Screen</title>
  <style>
    body{margin:0;font-family:sans-serif;background:#0b0f14;color:#e8eefc}
    header{padding:10px 14px;background:#121826;border-bottom:1px solid #223}
    main{display:flex;gap:18px;padding:14px;flex-wrap:wrap}
    img{background:#000;border:1px solid #333;max-height:80vh}
    fieldset{border:1px solid #223;margin-bottom:10px}
    pre{background:#121826;padding:8px;max-width:420px;overflow:auto;font-size:12px}
    button,select,input{margin:2px}
  </style>
</head>
<body>
  <header><strong>Smart Screen</strong> <span id="conn"></span></header>
  <main>
    <div><img id="screen" src="/stream.mjpeg" alt="screen"/></div>
    <div>
      <fieldset><legend>Brightness</legend>
        <input id="bri" type="range" min="0" max="100" value="25"/>
      </fieldset>
      <fieldset><legend>Orientation</legend>
        <select id="ori">
          <option>portrait</option><option>reverse_portrait</option>
          <option>landscape</option><option>reverse_landscape</option>
        </select>
        <button id="oriSet">Set</button>
      </fieldset>
      <fieldset><legend>LED</legend>
        <input id="led" type="color" value="#ff0000"/>
      </fieldset>
      <fieldset><legend>Power</legend>
        <button id="on">On</button><button id="off">Off</button>
      </fieldset>
      <button id="quit">Quit</button>
      <pre id="status"></pre>
    </div>
  </main>
<script>
async function post(path, body){
  const r = await fetch(path, {method:'POST', headers:{'Content-Type':'application/json'}, body:JSON.stringify(body)});
  const t = await r.text();
  if (!r.ok) alert(t);
}
function hexToCsv(h){
  return [1,3,5].map(i => parseInt(h.substr(i,2),16)).join(',');
}
document.getElementById('bri').onchange = e => post('/api/brightness', {level: parseInt(e.target.value)});
document.getElementById('oriSet').onclick = () => post('/api/orientation', {orientation: document.getElementById('ori').value});
document.getElementById('led').onchange = e => post('/api/led', {color: hexToCsv(e.target.value)});
document.getElementById('on').onclick = () => post('/api/power', {on:true});
document.getElementById('off').onclick = () => post('/api/power', {on:false});
document.getElementById('quit').onclick = () => fetch('/api/quit', {method:'POST'});
async function poll(){
  try {
    const r = await fetch('/api/status');
    const s = await r.json();
    document.getElementById('status').textContent = JSON.stringify(s, null, 2);
    document.getElementById('conn').textContent = s.connected ? 'connected' : 'disconnected';
  } catch (e) {}
  setTimeout(poll, 1000);
}
poll();
</script>
</body>
</html>
)HTML";

static void handle_command(const char *cmd, const httplib::Request &req, httplib::Response &res) {
  bool (*handler)(const std::string&, const std::string&, std::string&, int&) = nullptr;
  {
    std::lock_guard<std::mutex> lk(g_mtx);
    handler = g_command;
  }
  if (!handler) {
    res.status = 500;
    res.set_content("{\"error\":\"no command handler\"}", "application/json");
    return;
  }
  std::string out;
  int code = 200;
  handler(cmd, req.body, out, code);
  res.status = code;
  res.set_content(out, "application/json");
}

void control_start_detached(int port) {
  std::thread([port]() {
    httplib::Server svr;

    svr.Get("/", [](const httplib::Request&, httplib::Response &res) {
      res.set_content(kIndexHtml, "text/html; charset=utf-8");
    });

    svr.Get("/api/status", [](const httplib::Request&, httplib::Response &res) {
      std::string (*st)() = nullptr;
      {
        std::lock_guard<std::mutex> lk(g_mtx);
        st = g_status;
      }
      if (!st) {
        res.status = 500;
        res.set_content("{\"error\":\"no status provider\"}", "application/json");
        return;
      }
      set_no_cache_headers(res);
      res.set_content(st(), "application/json");
    });

    svr.Post("/api/brightness", [](const httplib::Request &req, httplib::Response &res) {
      handle_command("brightness", req, res);
    });
    svr.Post("/api/orientation", [](const httplib::Request &req, httplib::Response &res) {
      handle_command("orientation", req, res);
    });
    svr.Post("/api/led", [](const httplib::Request &req, httplib::Response &res) {
      handle_command("led", req, res);
    });
    svr.Post("/api/power", [](const httplib::Request &req, httplib::Response &res) {
      handle_command("power", req, res);
    });

    svr.Post("/api/quit", [](const httplib::Request&, httplib::Response &res) {
      std::atomic<bool> *q = nullptr;
      {
        std::lock_guard<std::mutex> lk(g_mtx);
        q = g_quit;
      }
      if (q) q->store(true);
      g_frame_cv.notify_all();
      res.set_content("{\"ok\":true}", "application/json");
    });

    svr.Get("/screen.jpg", [](const httplib::Request&, httplib::Response &res) {
      std::vector<uint8_t> jpg;
      {
        std::lock_guard<std::mutex> lk(g_frame_mtx);
        jpg = g_current_frame;
      }
      if (jpg.empty()) {
        res.status = 404;
        res.set_content("no frame yet", "text/plain");
        return;
      }
      set_no_cache_headers(res);
      res.set_content(reinterpret_cast<const char*>(jpg.data()), jpg.size(), "image/jpeg");
    });

    // Each part begins with --frame
    svr.Get("/stream.mjpeg", [](const httplib::Request&, httplib::Response &res) {
      set_no_cache_headers(res);
      res.set_content_provider(
        "multipart/x-mixed-replace; boundary=frame",
        [](size_t /*offset*/, httplib::DataSink &sink) -> bool {
          uint64_t last_sent_seq = 0;

          while (!quit_requested()) {
            std::vector<uint8_t> frame_to_send;
            {
              std::unique_lock<std::mutex> lk(g_frame_mtx);
              bool fresh = g_frame_cv.wait_for(lk, std::chrono::milliseconds(500), [&] {
                return g_frame_sequence > last_sent_seq;
              });
              if (!fresh) continue;
              frame_to_send = g_current_frame;
              last_sent_seq = g_frame_sequence;
            }
            if (frame_to_send.empty()) continue;

            std::string header;
            header.reserve(128);
            header += "--frame\r\n";
            header += "Content-Type: image/jpeg\r\n";
            header += "Content-Length: " + std::to_string(frame_to_send.size()) + "\r\n";
            header += "\r\n";

            if (!sink.write(header.data(), header.size())) return false;
            if (!sink.write(reinterpret_cast<const char*>(frame_to_send.data()), frame_to_send.size())) return false;
            if (!sink.write("\r\n", 2)) return false;

            if (sink.is_writable && !sink.is_writable()) return false;
          }
          sink.done();
          return true;
        }
      );
    });

    std::string addr;
    {
      std::lock_guard<std::mutex> lk(g_mtx);
      addr = g_listen_addr;
    }
    fprintf(stderr, "[control] listening on %s:%d\n", addr.c_str(), port);
    if (!svr.listen(addr.c_str(), port)) {
      fprintf(stderr, "[control] cannot listen on %s:%d\n", addr.c_str(), port);
    }
  }).detach();
}
