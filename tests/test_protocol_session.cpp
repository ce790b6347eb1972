#include "capability_model.h"
#include "lcd_codec.h"
#include "mock_transport.h"
#include "protocol_session.h"
#include "sim_panel.h"

#include <string.h>
#include <memory>
#include <string>
#include <unity.h>
#include <vector>

void setUp() {}
void tearDown() {}

namespace {

typedef ProtocolSession::State State;

std::unique_ptr<ProtocolSession> make_session(const char *rev, std::shared_ptr<mock_wire> wire)
{
	capability_model cap;
	TEST_ASSERT_TRUE(capability_lookup(rev, &cap, nullptr));
	session_opts o;
	o.sleep_fn = [](uint32_t) {};
	return std::unique_ptr<ProtocolSession>(new ProtocolSession(
		cap, lcd_codec_for(cap, nullptr), std::unique_ptr<ByteTransport>(new MockTransport(wire)), o));
}

void assert_bytes(const std::vector<uint8_t> &want, const std::vector<uint8_t> &got, const char *msg)
{
	TEST_ASSERT_EQUAL_size_t_MESSAGE(want.size(), got.size(), msg);
	TEST_ASSERT_EQUAL_HEX8_ARRAY_MESSAGE(want.data(), got.data(), want.size(), msg);
}

std::vector<uint8_t> rev_b_hello_answer(uint8_t sub)
{
	return { 0xCA, 'H', 'E', 'L', 'L', 'O', 0x0A, sub, 0x00, 0xCA };
}

const uint32_t kRed = 0xFFFF0000u;

} // namespace

namespace rev_a {

void test_silent_panel_is_turing_3_5()
{
	auto wire = std::make_shared<mock_wire>();
	auto s = make_session("A", wire);
	std::string err;
	TEST_ASSERT_EQUAL_INT(LcdStatus::OK, s->connect(&err));
	TEST_ASSERT_EQUAL_INT(State::READY, s->state());
	TEST_ASSERT_EQUAL_STRING("turing_3_5", s->device().variant.c_str());
	assert_bytes(std::vector<uint8_t>(6, 0x45), wire->writes.at(0), "HELLO is six 0x45 bytes");
}

void test_usbmonitor_answer()
{
	auto wire = std::make_shared<mock_wire>();
	wire->reply(std::vector<uint8_t>(6, 0x01));
	auto s = make_session("A", wire);
	TEST_ASSERT_EQUAL_INT(LcdStatus::OK, s->connect(nullptr));
	TEST_ASSERT_EQUAL_STRING("usbmonitor_3_5", s->device().variant.c_str());
}

void test_size_mismatch_fails_handshake()
{
	auto wire = std::make_shared<mock_wire>();
	wire->reply(std::vector<uint8_t>(6, 0x02));   // a 5" panel
	auto s = make_session("A", wire);
	std::string err;
	TEST_ASSERT_EQUAL_INT(LcdStatus::HANDSHAKE_FAILED, s->connect(&err));
	TEST_ASSERT_EQUAL_INT(State::DISCONNECTED, s->state());
	TEST_ASSERT_FALSE(err.empty());
}

void test_malformed_answer_fails_handshake()
{
	auto wire = std::make_shared<mock_wire>();
	wire->reply({ 0x01, 0x02, 0x03 });
	auto s = make_session("A", wire);
	TEST_ASSERT_EQUAL_INT(LcdStatus::HANDSHAKE_FAILED, s->connect(nullptr));
	TEST_ASSERT_EQUAL_INT(State::DISCONNECTED, s->state());
	TEST_ASSERT_EQUAL_INT_MESSAGE(1, wire->closes, "Transport is closed after a failed handshake");
}

void test_brightness_golden_bytes()
{
	auto wire = std::make_shared<mock_wire>();
	auto s = make_session("A", wire);
	TEST_ASSERT_EQUAL_INT(LcdStatus::OK, s->connect(nullptr));
	TEST_ASSERT_EQUAL_INT(LcdStatus::OK, s->setBrightness(25, nullptr));
	// 25% -> 191 on the inverted 0..255 scale, packed into the x field.
	assert_bytes({ 47, 192, 0, 0, 0, 110 }, wire->writes.back(), "brightness command");
}

void test_region_golden_bytes()
{
	auto wire = std::make_shared<mock_wire>();
	auto s = make_session("A", wire);
	TEST_ASSERT_EQUAL_INT(LcdStatus::OK, s->connect(nullptr));
	size_t before = wire->writes.size();

	rect_u32 r; r.x = 1; r.y = 2; r.w = 2; r.h = 1;
	const uint32_t px[2] = { kRed, kRed };
	TEST_ASSERT_EQUAL_INT(LcdStatus::OK, s->sendFrame(r, px, nullptr));
	TEST_ASSERT_EQUAL_size_t(before + 2, wire->writes.size());
	assert_bytes({ 0, 64, 32, 8, 2, 197 }, wire->writes[before], "DISPLAY_BITMAP header");
	assert_bytes({ 0x00, 0xF8, 0x00, 0xF8 }, wire->writes[before + 1], "RGB565 little-endian payload");
}

void test_orientation_switches_logical_size()
{
	auto wire = std::make_shared<mock_wire>();
	auto s = make_session("A", wire);
	TEST_ASSERT_EQUAL_INT(LcdStatus::OK, s->connect(nullptr));
	TEST_ASSERT_EQUAL_INT(LcdStatus::OK, s->setOrientation(ORIENT_LANDSCAPE, nullptr));
	const std::vector<uint8_t> &b = wire->writes.back();
	TEST_ASSERT_EQUAL_size_t(16, b.size());
	TEST_ASSERT_EQUAL_UINT8(121, b[5]);
	TEST_ASSERT_EQUAL_UINT8(102, b[6]);
	TEST_ASSERT_EQUAL_UINT8(0x01, b[7]);
	TEST_ASSERT_EQUAL_UINT8(0xE0, b[8]);
	TEST_ASSERT_EQUAL_UINT8(0x01, b[9]);
	TEST_ASSERT_EQUAL_UINT8(0x40, b[10]);

	std::vector<uint32_t> full((size_t)480 * 320, kRed);
	TEST_ASSERT_EQUAL_INT(LcdStatus::OK, s->sendFullFrame(full.data(), nullptr));

	rect_u32 tall; tall.w = 320; tall.h = 480;
	TEST_ASSERT_EQUAL_INT_MESSAGE(LcdStatus::CONFIG_ERROR, s->sendFrame(tall, full.data(), nullptr),
		"Portrait-sized region no longer fits the landscape canvas");
}

} // namespace rev_a

namespace rev_b {

void test_flagship_hello_and_led()
{
	auto wire = std::make_shared<mock_wire>();
	wire->reply(rev_b_hello_answer(0x12));
	auto s = make_session("B_FLAGSHIP", wire);
	TEST_ASSERT_EQUAL_INT(LcdStatus::OK, s->connect(nullptr));
	TEST_ASSERT_EQUAL_STRING("A12", s->device().variant.c_str());
	assert_bytes({ 0xCA, 'H', 'E', 'L', 'L', 'O', 0, 0, 0, 0xCA }, wire->writes.at(0), "HELLO command");

	rgb_u8 c; c.r = 10; c.g = 20; c.b = 30;
	TEST_ASSERT_EQUAL_INT(LcdStatus::OK, s->setLed(c, nullptr));
	assert_bytes({ 0xCD, 10, 20, 30, 0, 0, 0, 0, 0, 0xCD }, wire->writes.back(), "lighting command");

	TEST_ASSERT_EQUAL_INT(LcdStatus::OK, s->setBrightness(50, nullptr));
	assert_bytes({ 0xCE, 127, 0, 0, 0, 0, 0, 0, 0, 0xCE }, wire->writes.back(), "brightness command");
}

void test_framing_of_a_region()
{
	auto wire = std::make_shared<mock_wire>();
	wire->reply(rev_b_hello_answer(0x11));
	auto s = make_session("B", wire);
	TEST_ASSERT_EQUAL_INT(LcdStatus::OK, s->connect(nullptr));
	size_t before = wire->writes.size();

	rect_u32 r; r.x = 1; r.y = 2; r.w = 2; r.h = 1;
	const uint32_t px[2] = { kRed, kRed };
	TEST_ASSERT_EQUAL_INT(LcdStatus::OK, s->sendFrame(r, px, nullptr));
	assert_bytes({ 0xCC, 0, 1, 0, 2, 0, 2, 0, 2, 0xCC }, wire->writes.at(before), "DISPLAY_BITMAP header");
	assert_bytes({ 0xF8, 0x00, 0xF8, 0x00 }, wire->writes.at(before + 1), "RGB565 big-endian payload");
}

void test_led_unsupported_without_backplate()
{
	auto wire = std::make_shared<mock_wire>();
	wire->reply(rev_b_hello_answer(0x11));
	auto s = make_session("B", wire);
	TEST_ASSERT_EQUAL_INT(LcdStatus::OK, s->connect(nullptr));
	size_t before = wire->writes.size();
	rgb_u8 c;
	TEST_ASSERT_EQUAL_INT(LcdStatus::UNSUPPORTED_OPERATION, s->setLed(c, nullptr));
	TEST_ASSERT_EQUAL_size_t_MESSAGE(before, wire->writes.size(), "Nothing written for an unsupported operation");
	TEST_ASSERT_EQUAL_INT(State::READY, s->state());
}

void test_silence_fails_handshake()
{
	auto wire = std::make_shared<mock_wire>();
	auto s = make_session("B", wire);
	std::string err;
	TEST_ASSERT_EQUAL_INT(LcdStatus::HANDSHAKE_FAILED, s->connect(&err));
	TEST_ASSERT_EQUAL_INT(State::DISCONNECTED, s->state());
}

void test_wrong_frame_fails_handshake()
{
	auto wire = std::make_shared<mock_wire>();
	std::vector<uint8_t> bad = rev_b_hello_answer(0x11);
	bad[9] = 0x00;
	wire->reply(bad);
	auto s = make_session("B", wire);
	TEST_ASSERT_EQUAL_INT(LcdStatus::HANDSHAKE_FAILED, s->connect(nullptr));
}

} // namespace rev_b

namespace rev_c {

std::shared_ptr<mock_wire> connected_wire(std::unique_ptr<ProtocolSession> &s)
{
	auto wire = std::make_shared<mock_wire>();
	std::vector<uint8_t> rom(23, 0);
	const char *name = "chs_5inch.dev1_rom1.87";
	memcpy(rom.data(), name, strlen(name));
	wire->reply(rom);
	s = make_session("C", wire);
	TEST_ASSERT_EQUAL_INT(LcdStatus::OK, s->connect(nullptr));
	return wire;
}

void test_hello_is_padded_to_250()
{
	std::unique_ptr<ProtocolSession> s;
	auto wire = connected_wire(s);
	TEST_ASSERT_EQUAL_STRING("chs_5inch.dev1_rom1.87", s->device().variant.c_str());
	const std::vector<uint8_t> &h = wire->writes.at(0);
	TEST_ASSERT_EQUAL_size_t(250, h.size());
	TEST_ASSERT_EQUAL_HEX8(0x01, h[0]);
	TEST_ASSERT_EQUAL_HEX8(0xEF, h[1]);
	TEST_ASSERT_EQUAL_HEX8(0x69, h[2]);
	TEST_ASSERT_EQUAL_HEX8(0xD3, h[11]);
	TEST_ASSERT_EQUAL_HEX8(0x00, h[249]);
}

void test_brightness_packet()
{
	std::unique_ptr<ProtocolSession> s;
	auto wire = connected_wire(s);
	TEST_ASSERT_EQUAL_INT(LcdStatus::OK, s->setBrightness(100, nullptr));
	const std::vector<uint8_t> &b = wire->writes.back();
	TEST_ASSERT_EQUAL_size_t(250, b.size());
	TEST_ASSERT_EQUAL_HEX8(0x7B, b[0]);
	TEST_ASSERT_EQUAL_HEX8(0xFF, b[10]);
}

void test_partial_update_is_unsupported()
{
	std::unique_ptr<ProtocolSession> s;
	auto wire = connected_wire(s);
	rect_u32 r; r.w = 10; r.h = 10;
	std::vector<uint32_t> px(100, kRed);
	TEST_ASSERT_EQUAL_INT(LcdStatus::UNSUPPORTED_OPERATION, s->sendFrame(r, px.data(), nullptr));
	TEST_ASSERT_EQUAL_INT(State::READY, s->state());
}

void test_full_frame_is_sliced_into_250_byte_packets()
{
	std::unique_ptr<ProtocolSession> s;
	auto wire = connected_wire(s);
	size_t before = wire->writes.size();
	std::vector<uint32_t> px((size_t)480 * 800, kRed);
	TEST_ASSERT_EQUAL_INT(LcdStatus::OK, s->sendFullFrame(px.data(), nullptr));

	const size_t payload = (size_t)480 * 800 * 4;
	const size_t packets = (payload + 248) / 249;
	TEST_ASSERT_EQUAL_size_t(before + 3 + packets + 1, wire->writes.size());
	for (size_t i=before; i<wire->writes.size(); i++) {
		TEST_ASSERT_EQUAL_size_t_MESSAGE(250, wire->writes[i].size(), "Every write is one 250-byte packet");
	}
	TEST_ASSERT_EQUAL_HEX8(0x2C, wire->writes[before + 1][0]);
	TEST_ASSERT_EQUAL_HEX8(0x2C, wire->writes[before + 1][249]);
	// BGRA red, last data byte of a packet is at 248, byte 249 is padding.
	const std::vector<uint8_t> &first = wire->writes[before + 3];
	TEST_ASSERT_EQUAL_HEX8(0x00, first[0]);
	TEST_ASSERT_EQUAL_HEX8(0x00, first[1]);
	TEST_ASSERT_EQUAL_HEX8(0xFF, first[2]);
	TEST_ASSERT_EQUAL_HEX8(0xFF, first[3]);
	TEST_ASSERT_EQUAL_HEX8(0x00, first[249]);
}

} // namespace rev_c

namespace rev_e {

std::shared_ptr<mock_wire> connected_wire(std::unique_ptr<ProtocolSession> &s)
{
	auto wire = std::make_shared<mock_wire>();
	std::vector<uint8_t> rom(23, 0);
	const char *name = "chs_88inch.dev1_rom1.88";
	memcpy(rom.data(), name, strlen(name));
	wire->reply(rom);
	s = make_session("E", wire);
	TEST_ASSERT_EQUAL_INT(LcdStatus::OK, s->connect(nullptr));
	return wire;
}

void test_hello_answer_identifies_8_8()
{
	std::unique_ptr<ProtocolSession> s;
	auto wire = connected_wire(s);
	TEST_ASSERT_EQUAL_STRING("chs_88inch.dev1_rom1.88", s->device().variant.c_str());
	const std::vector<uint8_t> &h = wire->writes.at(0);
	TEST_ASSERT_EQUAL_size_t(250, h.size());
	TEST_ASSERT_EQUAL_HEX8(0x01, h[0]);
	TEST_ASSERT_EQUAL_HEX8(0xC5, h[10]);
	TEST_ASSERT_EQUAL_HEX8(0xD3, h[11]);
}

void test_5_inch_answer_is_rejected()
{
	auto wire = std::make_shared<mock_wire>();
	std::vector<uint8_t> rom(23, 0);
	memcpy(rom.data(), "chs_5inch", 9);
	wire->reply(rom);
	auto s = make_session("E", wire);
	TEST_ASSERT_EQUAL_INT(LcdStatus::HANDSHAKE_FAILED, s->connect(nullptr));
}

void test_flip_option_packet()
{
	std::unique_ptr<ProtocolSession> s;
	auto wire = connected_wire(s);
	TEST_ASSERT_EQUAL_INT(LcdStatus::OK, s->setOrientation(ORIENT_REVERSE_PORTRAIT, nullptr));
	const std::vector<uint8_t> &o = wire->writes.back();
	const uint8_t want[] = { 0x7D, 0xEF, 0x69, 0x00, 0x00, 0x00, 0x05, 0x00, 0x00, 0x00, 0xFF, 0x00, 0x00, 0x01, 0x00 };
	TEST_ASSERT_EQUAL_size_t(250, o.size());
	TEST_ASSERT_EQUAL_HEX8_ARRAY(want, o.data(), sizeof(want));
	TEST_ASSERT_EQUAL_HEX8(0x00, o[249]);
}

void test_partial_update_is_unsupported()
{
	std::unique_ptr<ProtocolSession> s;
	auto wire = connected_wire(s);
	rect_u32 r; r.w = 10; r.h = 10;
	std::vector<uint32_t> px(100, kRed);
	TEST_ASSERT_EQUAL_INT(LcdStatus::UNSUPPORTED_OPERATION, s->sendFrame(r, px.data(), nullptr));
}

void test_full_frame_sequence()
{
	std::unique_ptr<ProtocolSession> s;
	auto wire = connected_wire(s);
	TEST_ASSERT_EQUAL_INT(LcdStatus::OK, s->setBrightness(100, nullptr));
	size_t before = wire->writes.size();

	std::vector<uint32_t> px((size_t)480 * 1920, kRed);
	px[0] = 0xFF00FF00u;
	TEST_ASSERT_EQUAL_INT(LcdStatus::OK, s->sendFullFrame(px.data(), nullptr));

	const size_t payload = (size_t)1920 * 480 * 4;
	const size_t packets = (payload + 248) / 249;
	TEST_ASSERT_EQUAL_size_t(before + 7 + packets + 1, wire->writes.size());
	TEST_ASSERT_EQUAL_HEX8(0x96, wire->writes[before][0]);
	TEST_ASSERT_EQUAL_HEX8(0x79, wire->writes[before + 1][0]);
	TEST_ASSERT_EQUAL_HEX8(0x7D, wire->writes[before + 2][0]);
	TEST_ASSERT_EQUAL_HEX8(0x86, wire->writes[before + 3][0]);
	TEST_ASSERT_EQUAL_HEX8(0x2C, wire->writes[before + 4][249]);
	TEST_ASSERT_EQUAL_HEX8(0x7B, wire->writes[before + 5][0]);
	TEST_ASSERT_EQUAL_HEX8_MESSAGE(0xFF, wire->writes[before + 5][10], "Brightness is re-sent with the frame");

	const uint8_t display[] = { 0xC8, 0xEF, 0x69, 0x00, 0x38, 0x40, 0x00, 0x00 };
	TEST_ASSERT_EQUAL_HEX8_ARRAY(display, wire->writes[before + 6].data(), sizeof(display));
	TEST_ASSERT_EQUAL_HEX8(0xCF, wire->writes.back()[0]);

	// Portrait top-left lands at the end of the first native row: pixel 1919, byte 7676.
	const std::vector<uint8_t> &p = wire->writes[before + 7 + 7676 / 249];
	const size_t off = 7676 % 249;
	TEST_ASSERT_EQUAL_HEX8(0x00, p[off]);
	TEST_ASSERT_EQUAL_HEX8(0xFF, p[off + 1]);
	TEST_ASSERT_EQUAL_HEX8(0x00, p[off + 2]);
	TEST_ASSERT_EQUAL_HEX8(0x00, p[249]);
}

void test_reset_restarts_and_reopens()
{
	std::unique_ptr<ProtocolSession> s;
	auto wire = connected_wire(s);
	size_t before = wire->writes.size();
	TEST_ASSERT_EQUAL_INT(LcdStatus::OK, s->reset(nullptr));
	TEST_ASSERT_EQUAL_size_t(before + 3, wire->writes.size());
	TEST_ASSERT_EQUAL_HEX8(0x01, wire->writes[before][0]);
	TEST_ASSERT_EQUAL_HEX8(0x84, wire->writes[before + 1][0]);
	TEST_ASSERT_EQUAL_HEX8(0x84, wire->writes[before + 2][0]);
	TEST_ASSERT_EQUAL_INT(1, wire->closes);
	TEST_ASSERT_EQUAL_INT(2, wire->opens);
}

} // namespace rev_e

namespace rev_d {

void test_no_identification_needed()
{
	auto wire = std::make_shared<mock_wire>();
	auto s = make_session("D", wire);
	TEST_ASSERT_EQUAL_INT(LcdStatus::OK, s->connect(nullptr));
	TEST_ASSERT_EQUAL_size_t(0, wire->writes.size());
}

void test_brightness_is_sent_twice()
{
	auto wire = std::make_shared<mock_wire>();
	auto s = make_session("D", wire);
	TEST_ASSERT_EQUAL_INT(LcdStatus::OK, s->connect(nullptr));
	TEST_ASSERT_EQUAL_INT(LcdStatus::OK, s->setBrightness(40, nullptr));
	TEST_ASSERT_EQUAL_size_t(2, wire->writes.size());
	assert_bytes({ 67, 67, 0x00, 0xC8 }, wire->writes[0], "first backlight command");
	assert_bytes({ 67, 67, 0x00, 0xC8 }, wire->writes[1], "repeated backlight command");
}

void test_payload_has_0x50_prefix()
{
	auto wire = std::make_shared<mock_wire>();
	auto s = make_session("D", wire);
	TEST_ASSERT_EQUAL_INT(LcdStatus::OK, s->connect(nullptr));
	rect_u32 r; r.w = 1; r.h = 1;
	TEST_ASSERT_EQUAL_INT(LcdStatus::OK, s->sendFrame(r, &kRed, nullptr));
	TEST_ASSERT_EQUAL_size_t(4, wire->writes.size());
	assert_bytes({ 67, 65, 0, 0, 0, 0, 0, 0, 0, 0 }, wire->writes[0], "block write window");
	assert_bytes({ 68, 0, 0, 0 }, wire->writes[1], "into picture mode");
	assert_bytes({ 0x50, 0xF8, 0x00 }, wire->writes[2], "prefixed payload");
	assert_bytes({ 65, 0, 0, 0 }, wire->writes[3], "out of picture mode");
}

} // namespace rev_d

namespace weact {

std::vector<uint8_t> version_answer()
{
	std::vector<uint8_t> v(19, 0);
	const char *ver = "V1.0.3  ";
	v[0] = 0xC2;
	memcpy(v.data() + 1, ver, 8);
	return v;
}

void test_version_handshake_and_brightness()
{
	auto wire = std::make_shared<mock_wire>();
	wire->reply(version_answer());
	auto s = make_session("WEACT_B", wire);
	TEST_ASSERT_EQUAL_INT(LcdStatus::OK, s->connect(nullptr));
	TEST_ASSERT_EQUAL_STRING("V1.0.3", s->device().variant.c_str());
	assert_bytes({ 0xC2, 0x0A }, wire->writes.at(0), "version query");

	TEST_ASSERT_EQUAL_INT(LcdStatus::OK, s->setBrightness(100, nullptr));
	assert_bytes({ 0x03, 0xFF, 0xE8, 0x03, 0x0A }, wire->writes.back(), "brightness with 1000 ms fade");
}

void test_short_version_fails_handshake()
{
	auto wire = std::make_shared<mock_wire>();
	wire->reply({ 0xC2, 'V', '1' });
	auto s = make_session("WEACT_B", wire);
	TEST_ASSERT_EQUAL_INT(LcdStatus::HANDSHAKE_FAILED, s->connect(nullptr));
	TEST_ASSERT_EQUAL_INT(State::DISCONNECTED, s->state());
}

} // namespace weact

namespace simulated {

void test_region_reaches_the_panel()
{
	capability_model cap;
	TEST_ASSERT_TRUE(capability_lookup("SIMU", &cap, nullptr));
	cap.width = 4;
	cap.height = 2;
	auto panel = std::make_shared<SimulatedPanel>(4, 2, cap.max_payload, cap.checksum);

	session_opts o;
	o.sleep_fn = [](uint32_t) {};
	LcdStatus st = LcdStatus::OK;
	std::string err;
	std::unique_ptr<ProtocolSession> s = session_connect(cap, "", 0, false, o, panel, &st, &err);
	TEST_ASSERT_NOT_NULL_MESSAGE(s.get(), err.c_str());

	rect_u32 r; r.x = 1; r.y = 1; r.w = 2; r.h = 1;
	const uint32_t px[2] = { pack_xrgb8888(1, 2, 3), pack_xrgb8888(4, 5, 6) };
	TEST_ASSERT_EQUAL_INT(LcdStatus::OK, s->sendFrame(r, px, nullptr));

	sim_panel_stats ps = panel->stats();
	TEST_ASSERT_EQUAL_UINT64(1, ps.region_frames);
	TEST_ASSERT_EQUAL_UINT64(0, ps.checksum_errors);
	std::vector<uint32_t> mirror;
	uint32_t w = 0, h = 0;
	panel->mirror(mirror, &w, &h);
	TEST_ASSERT_EQUAL_HEX32(px[0], mirror[1 * 4 + 1]);
	TEST_ASSERT_EQUAL_HEX32(px[1], mirror[1 * 4 + 2]);
	TEST_ASSERT_EQUAL_HEX32(0xFF000000u, mirror[0]);
}

void test_missing_panel_is_a_config_error()
{
	capability_model cap;
	TEST_ASSERT_TRUE(capability_lookup("SIMU", &cap, nullptr));
	LcdStatus st = LcdStatus::OK;
	std::unique_ptr<ProtocolSession> s = session_connect(cap, "", 0, false, session_opts(), nullptr, &st, nullptr);
	TEST_ASSERT_NULL(s.get());
	TEST_ASSERT_EQUAL_INT(LcdStatus::CONFIG_ERROR, st);
}

} // namespace simulated

namespace recovery {

void test_single_timeout_is_retried()
{
	auto wire = std::make_shared<mock_wire>();
	auto s = make_session("A", wire);
	TEST_ASSERT_EQUAL_INT(LcdStatus::OK, s->connect(nullptr));
	wire->timeouts = 1;
	TEST_ASSERT_EQUAL_INT(LcdStatus::OK, s->setBrightness(50, nullptr));
	TEST_ASSERT_EQUAL_UINT64(0, s->recoveries());
	TEST_ASSERT_EQUAL_INT(State::READY, s->state());
}

void test_two_timeouts_reset_and_recover()
{
	auto wire = std::make_shared<mock_wire>();
	auto s = make_session("A", wire);
	std::vector<State> seen;
	s->setStateListener([&](State st) { seen.push_back(st); });
	TEST_ASSERT_EQUAL_INT(LcdStatus::OK, s->connect(nullptr));
	seen.clear();

	wire->timeouts = 2;
	rect_u32 r; r.w = 1; r.h = 1;
	std::string err;
	TEST_ASSERT_EQUAL_INT(LcdStatus::RECOVERED, s->sendFrame(r, &kRed, &err));
	TEST_ASSERT_EQUAL_INT(State::READY, s->state());
	TEST_ASSERT_EQUAL_UINT64(1, s->recoveries());

	TEST_ASSERT_EQUAL_size_t(3, seen.size());
	TEST_ASSERT_EQUAL_INT(State::SENDING, seen[0]);
	TEST_ASSERT_EQUAL_INT(State::ERROR_RECOVERY, seen[1]);
	TEST_ASSERT_EQUAL_INT(State::READY, seen[2]);

	// The reset command went out and the port was reopened.
	assert_bytes({ 0, 0, 0, 0, 0, 101 }, wire->writes.back(), "reset command");
	TEST_ASSERT_EQUAL_INT(2, wire->opens);

	TEST_ASSERT_EQUAL_INT_MESSAGE(LcdStatus::OK, s->sendFrame(r, &kRed, nullptr), "Session usable after recovery");
}

void test_failed_reset_loses_connection()
{
	auto wire = std::make_shared<mock_wire>();
	auto s = make_session("A", wire);
	TEST_ASSERT_EQUAL_INT(LcdStatus::OK, s->connect(nullptr));
	wire->timeouts = 4;
	std::string err;
	TEST_ASSERT_EQUAL_INT(LcdStatus::CONNECTION_LOST, s->setBrightness(10, &err));
	TEST_ASSERT_EQUAL_INT(State::DISCONNECTED, s->state());
	TEST_ASSERT_FALSE(err.empty());
	TEST_ASSERT_EQUAL_INT(LcdStatus::NOT_CONNECTED, s->setBrightness(10, nullptr));
}

void test_commands_need_a_connection()
{
	auto wire = std::make_shared<mock_wire>();
	auto s = make_session("A", wire);
	rect_u32 r; r.w = 1; r.h = 1;
	TEST_ASSERT_EQUAL_INT(LcdStatus::NOT_CONNECTED, s->sendFrame(r, &kRed, nullptr));
	TEST_ASSERT_EQUAL_INT(LcdStatus::NOT_CONNECTED, s->setBrightness(10, nullptr));
	TEST_ASSERT_EQUAL_size_t(0, wire->writes.size());
}

void test_bad_arguments_are_config_errors()
{
	auto wire = std::make_shared<mock_wire>();
	auto s = make_session("A", wire);
	TEST_ASSERT_EQUAL_INT(LcdStatus::OK, s->connect(nullptr));
	TEST_ASSERT_EQUAL_INT(LcdStatus::CONFIG_ERROR, s->setBrightness(101, nullptr));
	rect_u32 r; r.x = 319; r.y = 0; r.w = 2; r.h = 1;
	const uint32_t px[2] = { kRed, kRed };
	TEST_ASSERT_EQUAL_INT(LcdStatus::CONFIG_ERROR, s->sendFrame(r, px, nullptr));
	TEST_ASSERT_EQUAL_INT(State::READY, s->state());
}

} // namespace recovery

int main(int argc, char **argv)
{
	(void)argc; (void)argv;
	UNITY_BEGIN();

	RUN_TEST(rev_a::test_silent_panel_is_turing_3_5);
	RUN_TEST(rev_a::test_usbmonitor_answer);
	RUN_TEST(rev_a::test_size_mismatch_fails_handshake);
	RUN_TEST(rev_a::test_malformed_answer_fails_handshake);
	RUN_TEST(rev_a::test_brightness_golden_bytes);
	RUN_TEST(rev_a::test_region_golden_bytes);
	RUN_TEST(rev_a::test_orientation_switches_logical_size);

	RUN_TEST(rev_b::test_flagship_hello_and_led);
	RUN_TEST(rev_b::test_framing_of_a_region);
	RUN_TEST(rev_b::test_led_unsupported_without_backplate);
	RUN_TEST(rev_b::test_silence_fails_handshake);
	RUN_TEST(rev_b::test_wrong_frame_fails_handshake);

	RUN_TEST(rev_c::test_hello_is_padded_to_250);
	RUN_TEST(rev_c::test_brightness_packet);
	RUN_TEST(rev_c::test_partial_update_is_unsupported);
	RUN_TEST(rev_c::test_full_frame_is_sliced_into_250_byte_packets);
	RUN_TEST(rev_e::test_hello_answer_identifies_8_8);
	RUN_TEST(rev_e::test_5_inch_answer_is_rejected);
	RUN_TEST(rev_e::test_flip_option_packet);
	RUN_TEST(rev_e::test_partial_update_is_unsupported);
	RUN_TEST(rev_e::test_full_frame_sequence);
	RUN_TEST(rev_e::test_reset_restarts_and_reopens);

	RUN_TEST(rev_d::test_no_identification_needed);
	RUN_TEST(rev_d::test_brightness_is_sent_twice);
	RUN_TEST(rev_d::test_payload_has_0x50_prefix);

	RUN_TEST(weact::test_version_handshake_and_brightness);
	RUN_TEST(weact::test_short_version_fails_handshake);

	RUN_TEST(simulated::test_region_reaches_the_panel);
	RUN_TEST(simulated::test_missing_panel_is_a_config_error);

	RUN_TEST(recovery::test_single_timeout_is_retried);
	RUN_TEST(recovery::test_two_timeouts_reset_and_recover);
	RUN_TEST(recovery::test_failed_reset_loses_connection);
	RUN_TEST(recovery::test_commands_need_a_connection);
	RUN_TEST(recovery::test_bad_arguments_are_config_errors);

	return UNITY_END();
}
