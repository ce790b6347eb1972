#pragma once
#include <stdint.h>
#include <atomic>
#include <string>
#include <vector>

// Wiring from main program:
void control_set_status_provider(std::string (*fn)());
// cmd: "brightness" | "orientation" | "led" | "power"
void control_set_command_handler(bool (*fn)(const std::string &cmd, const std::string &body,
                                            std::string &out_json, int &out_http_status));
void control_set_quit_flag(std::atomic<bool> *quit_flag);
void control_set_listen_address(const std::string &addr);

// Latest rendered canvas as JPEG, served on /screen.jpg and /stream.mjpeg.
void control_publish_frame(std::vector<uint8_t> jpeg);

// Start server:
void control_start_detached(int port);
