#include "theme.h"
#include "widget_render.h"

#include <math.h>
#include <unity.h>
#include <vector>

void setUp() {}
void tearDown() {}

namespace radial_gauge {

radial_params gauge(double start, double end, bool cw)
{
	radial_params r;
	r.radius = 50;
	r.min = 0;
	r.max = 100;
	r.start_angle = start;
	r.end_angle = end;
	r.clockwise = cw;
	return r;
}

void test_single_step_is_linear()
{
	radial_params r = gauge(135, 45, true);   // 270 degrees clockwise
	TEST_ASSERT_EQUAL_FLOAT(270.0, radial_span(r));
	TEST_ASSERT_EQUAL_FLOAT(135.0, radial_angle(r, 0));
	TEST_ASSERT_EQUAL_FLOAT(270.0, radial_angle(r, 50));
	TEST_ASSERT_EQUAL_FLOAT(405.0, radial_angle(r, 100));
	TEST_ASSERT_EQUAL_FLOAT(0.0, radial_sweep(r, r.min));
	TEST_ASSERT_EQUAL_FLOAT(radial_span(r), radial_sweep(r, r.max));
}

void test_values_are_clamped()
{
	radial_params r = gauge(0, 180, true);
	TEST_ASSERT_EQUAL_FLOAT(0.0, radial_sweep(r, -20));
	TEST_ASSERT_EQUAL_FLOAT(180.0, radial_sweep(r, 250));
	TEST_ASSERT_EQUAL_FLOAT(0.0, radial_fraction(r, NAN));
}

void test_full_circle_twenty_steps_at_half()
{
	radial_params r = gauge(60, 420, true);
	r.step_count = 20;
	TEST_ASSERT_EQUAL_FLOAT(360.0, radial_span(r));
	TEST_ASSERT_EQUAL_FLOAT(240.0, radial_angle(r, 50));
	TEST_ASSERT_EQUAL_INT(10, radial_filled_steps(r, 50));

	r.step_sep = 4;
	TEST_ASSERT_EQUAL_INT_MESSAGE(10, radial_filled_steps(r, 50), "Separation does not change the lit count");
	TEST_ASSERT_EQUAL_INT(0, radial_filled_steps(r, 0));
	TEST_ASSERT_EQUAL_INT(20, radial_filled_steps(r, 100));
}

void test_step_lit_at_its_midpoint()
{
	radial_params r = gauge(0, 100, true);
	r.step_count = 10;   // 10 degree segments, midpoints at 5, 15, ...
	TEST_ASSERT_FALSE(radial_step_filled(r, 0, 4.9));
	TEST_ASSERT_TRUE_MESSAGE(radial_step_filled(r, 0, 5.0), "A sweep ending exactly on the midpoint lights it");
	TEST_ASSERT_TRUE(radial_step_filled(r, 1, 15.0));
	TEST_ASSERT_FALSE(radial_step_filled(r, 2, 15.0));
}

void test_counter_clockwise_span_is_negative()
{
	radial_params r = gauge(90, 0, false);
	TEST_ASSERT_EQUAL_FLOAT(-90.0, radial_span(r));
	TEST_ASSERT_EQUAL_FLOAT(45.0, radial_angle(r, 50));
	TEST_ASSERT_EQUAL_FLOAT(0.0, radial_angle(r, 100));

	r.step_count = 9;
	TEST_ASSERT_EQUAL_INT(9, radial_filled_steps(r, 100));
	TEST_ASSERT_EQUAL_INT(0, radial_filled_steps(r, 0));
}

void test_equal_angles_mean_a_full_turn()
{
	radial_params r = gauge(30, 30, true);
	TEST_ASSERT_EQUAL_FLOAT(360.0, radial_span(r));
	r.clockwise = false;
	TEST_ASSERT_EQUAL_FLOAT(-360.0, radial_span(r));
}

} // namespace radial_gauge

namespace linear_bar {

void test_fill_length()
{
	bar_params b;
	b.min = 0;
	b.max = 200;
	TEST_ASSERT_EQUAL_UINT32(0, bar_fill_length(b, 0, 100));
	TEST_ASSERT_EQUAL_UINT32(50, bar_fill_length(b, 100, 100));
	TEST_ASSERT_EQUAL_UINT32(100, bar_fill_length(b, 200, 100));
	TEST_ASSERT_EQUAL_UINT32(100, bar_fill_length(b, 900, 100));
	TEST_ASSERT_EQUAL_UINT32(0, bar_fill_length(b, -5, 100));
}

} // namespace linear_bar

namespace line_graph {

void test_ring_evicts_oldest()
{
	HistoryRing ring(3);
	ring.push(1);
	ring.push(2);
	TEST_ASSERT_EQUAL_size_t(2, ring.size());
	ring.push(3);
	ring.push(4);
	ring.push(5);
	TEST_ASSERT_EQUAL_size_t_MESSAGE(3, ring.size(), "Size never exceeds the history length");
	std::vector<double> v = ring.values();
	TEST_ASSERT_EQUAL_FLOAT(3, v[0]);
	TEST_ASSERT_EQUAL_FLOAT(4, v[1]);
	TEST_ASSERT_EQUAL_FLOAT(5, v[2]);
}

void test_autoscale_range()
{
	graph_params g;
	g.autoscale = true;
	HistoryRing ring(5);
	ring.push(20);
	ring.push(-4);
	ring.push(7);
	double lo = 0, hi = 0;
	graph_range(g, ring, &lo, &hi);
	TEST_ASSERT_EQUAL_FLOAT(-4, lo);
	TEST_ASSERT_EQUAL_FLOAT(20, hi);

	HistoryRing flat(5);
	flat.push(3);
	flat.push(3);
	graph_range(g, flat, &lo, &hi);
	TEST_ASSERT_EQUAL_FLOAT_MESSAGE(2, lo, "Flat data is widened so it can be plotted");
	TEST_ASSERT_EQUAL_FLOAT(4, hi);
}

void test_fixed_range_ignores_data()
{
	graph_params g;
	g.min = 0;
	g.max = 10;
	HistoryRing ring(4);
	ring.push(50);
	double lo = 0, hi = 0;
	graph_range(g, ring, &lo, &hi);
	TEST_ASSERT_EQUAL_FLOAT(0, lo);
	TEST_ASSERT_EQUAL_FLOAT(10, hi);
}

void test_points_span_the_box()
{
	graph_params g;
	g.min = 0;
	g.max = 100;
	HistoryRing ring(3);
	ring.push(0);
	ring.push(100);
	ring.push(50);
	std::vector<cv::Point> pts = graph_points(g, ring, 101, 11);
	TEST_ASSERT_EQUAL_size_t(3, pts.size());
	TEST_ASSERT_EQUAL_INT(0, pts[0].x);
	TEST_ASSERT_EQUAL_INT(10, pts[0].y);
	TEST_ASSERT_EQUAL_INT(50, pts[1].x);
	TEST_ASSERT_EQUAL_INT(0, pts[1].y);
	TEST_ASSERT_EQUAL_INT(100, pts[2].x);
	TEST_ASSERT_EQUAL_INT(5, pts[2].y);
}

void test_partial_history_starts_at_the_left()
{
	graph_params g;
	HistoryRing ring(5);
	ring.push(10);
	ring.push(20);
	std::vector<cv::Point> pts = graph_points(g, ring, 41, 10);
	TEST_ASSERT_EQUAL_size_t(2, pts.size());
	TEST_ASSERT_EQUAL_INT(0, pts[0].x);
	TEST_ASSERT_EQUAL_INT(10, pts[1].x);
}

} // namespace line_graph

namespace text {

void test_number_with_unit()
{
	TEST_ASSERT_EQUAL_STRING("42.5C", format_stat("%.1f", "C", stat_value::num(42.46), "-").c_str());
	TEST_ASSERT_EQUAL_STRING_MESSAGE("42%", format_stat("%.0f", "", stat_value::num(42, "%"), "-").c_str(),
		"Unit comes from the value when the widget sets none");
}

void test_unavailable_uses_fallback()
{
	TEST_ASSERT_EQUAL_STRING("--", format_stat("%.0f", "%", stat_value::unavailable(), "--").c_str());
	TEST_ASSERT_EQUAL_STRING("--", format_stat("%.0f", "%", stat_value::num(NAN), "--").c_str());
}

void test_text_value_is_shown_verbatim()
{
	TEST_ASSERT_EQUAL_STRING("12:34:56", format_stat("%.0f", "", stat_value::str("12:34:56"), "-").c_str());
}

} // namespace text

int main(int argc, char **argv)
{
	(void)argc; (void)argv;
	UNITY_BEGIN();

	RUN_TEST(radial_gauge::test_single_step_is_linear);
	RUN_TEST(radial_gauge::test_values_are_clamped);
	RUN_TEST(radial_gauge::test_full_circle_twenty_steps_at_half);
	RUN_TEST(radial_gauge::test_step_lit_at_its_midpoint);
	RUN_TEST(radial_gauge::test_counter_clockwise_span_is_negative);
	RUN_TEST(radial_gauge::test_equal_angles_mean_a_full_turn);

	RUN_TEST(linear_bar::test_fill_length);

	RUN_TEST(line_graph::test_ring_evicts_oldest);
	RUN_TEST(line_graph::test_autoscale_range);
	RUN_TEST(line_graph::test_fixed_range_ignores_data);
	RUN_TEST(line_graph::test_points_span_the_box);
	RUN_TEST(line_graph::test_partial_history_starts_at_the_left);

	RUN_TEST(text::test_number_with_unit);
	RUN_TEST(text::test_unavailable_uses_fallback);
	RUN_TEST(text::test_text_value_is_shown_verbatim);

	return UNITY_END();
}
