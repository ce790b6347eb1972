#include "compositor.h"
#include "stat_cache.h"
#include "theme.h"

#include <string>
#include <unity.h>
#include <vector>

void setUp() {}
void tearDown() {}

namespace {

const char *kTheme = R"JSON({
  "name": "compositor_test",
  "display": { "width": 60, "height": 120, "orientation": "landscape", "background": "0,0,64" },
  "widgets": [
    { "id": "a", "type": "text", "stat": "s.a", "interval": 100, "x": 0, "y": 0, "width": 40, "height": 20 },
    { "id": "b", "type": "bar", "stat": "s.b", "interval": 100, "x": 0, "y": 30, "width": 40, "height": 20,
      "outline": false, "barColor": "255,0,0" },
    { "id": "g", "type": "graph", "stat": "s.g", "interval": 100, "x": 60, "y": 0, "width": 60, "height": 60,
      "history": 5 },
    { "id": "label", "type": "text", "text": "hi", "x": 0, "y": 50, "width": 40, "height": 10 }
  ]
})JSON";

const uint32_t kBg = 0xFF000040u;

theme load_theme()
{
	theme t;
	std::string err;
	TEST_ASSERT_TRUE_MESSAGE(theme_from_json_text(kTheme, "", &t, &err), err.c_str());
	return t;
}

bool same_rect(const rect_u32 &a, const rect_u32 &b)
{
	return rect_equal(a, b);
}

size_t count_not(const canvas &c, const rect_u32 &r, uint32_t px)
{
	size_t n = 0;
	for (uint32_t y=r.y; y<r.y + r.h; y++)
		for (uint32_t x=r.x; x<r.x + r.w; x++)
			if (c.px[(size_t)y * c.w + x] != px) n++;
	return n;
}

} // namespace

namespace full_render {

void test_render_all_dirties_whole_canvas()
{
	theme t = load_theme();
	Compositor comp(t);
	StatCache cache;
	comp.renderAll(cache.snapshot());
	std::vector<rect_u32> dirty = comp.surface().takeDirty();
	TEST_ASSERT_EQUAL_size_t(1, dirty.size());
	TEST_ASSERT_TRUE(same_rect(comp.surface().bounds(), dirty[0]));
	TEST_ASSERT_EQUAL_UINT32(120, comp.surface().w);
	TEST_ASSERT_EQUAL_UINT32(60, comp.surface().h);
	TEST_ASSERT_EQUAL_HEX32_MESSAGE(kBg, comp.surface().px[(size_t)59 * 120 + 50], "Uncovered area shows the background colour");
}

void test_unavailable_values_draw_fallback()
{
	theme t = load_theme();
	Compositor comp(t);
	StatCache cache;
	comp.renderAll(cache.snapshot());
	TEST_ASSERT_TRUE_MESSAGE(count_not(comp.surface(), t.widgets[1].box, kBg) > 0, "Bar shows a fallback glyph");
	TEST_ASSERT_TRUE_MESSAGE(count_not(comp.surface(), t.widgets[2].box, kBg) > 0, "Graph shows a fallback glyph");
}

} // namespace full_render

namespace incremental {

void test_unchanged_values_are_not_redrawn()
{
	theme t = load_theme();
	Compositor comp(t);
	StatCache cache;
	comp.renderAll(cache.snapshot());
	comp.surface().takeDirty();

	std::vector<rect_u32> out = comp.renderDue({ 0, 1, 2 }, cache.snapshot());
	TEST_ASSERT_EQUAL_size_t(0, out.size());
	TEST_ASSERT_EQUAL_size_t(0, comp.surface().takeDirty().size());
}

void test_only_changed_widget_is_dirty()
{
	theme t = load_theme();
	Compositor comp(t);
	StatCache cache;
	comp.renderAll(cache.snapshot());
	comp.surface().takeDirty();

	cache.put("s.a", stat_value::num(5), 1);
	std::vector<rect_u32> out = comp.renderDue({ 0, 1, 2 }, cache.snapshot());
	TEST_ASSERT_EQUAL_size_t(1, out.size());
	TEST_ASSERT_TRUE(same_rect(t.widgets[0].box, out[0]));
	std::vector<rect_u32> dirty = comp.surface().takeDirty();
	TEST_ASSERT_EQUAL_size_t(1, dirty.size());
	TEST_ASSERT_TRUE(same_rect(t.widgets[0].box, dirty[0]));

	// Same value written again: nothing to do for a text widget.
	cache.put("s.a", stat_value::num(5), 2);
	TEST_ASSERT_EQUAL_size_t(0, comp.renderDue({ 0 }, cache.snapshot()).size());
}

void test_widget_not_due_is_not_redrawn()
{
	theme t = load_theme();
	Compositor comp(t);
	StatCache cache;
	comp.renderAll(cache.snapshot());
	comp.surface().takeDirty();

	cache.put("s.a", stat_value::num(1), 1);
	cache.put("s.b", stat_value::num(1), 1);
	std::vector<rect_u32> out = comp.renderDue({ 1 }, cache.snapshot());
	TEST_ASSERT_EQUAL_size_t(1, out.size());
	TEST_ASSERT_TRUE(same_rect(t.widgets[1].box, out[0]));
}

void test_bar_fill_pixels()
{
	theme t = load_theme();
	Compositor comp(t);
	StatCache cache;
	cache.put("s.b", stat_value::num(50), 1);
	comp.renderAll(cache.snapshot());
	const canvas &c = comp.surface();
	TEST_ASSERT_EQUAL_HEX32(pack_xrgb8888(255, 0, 0), c.px[(size_t)40 * c.w + 5]);
	TEST_ASSERT_EQUAL_HEX32(pack_xrgb8888(255, 0, 0), c.px[(size_t)40 * c.w + 19]);
	TEST_ASSERT_EQUAL_HEX32(kBg, c.px[(size_t)40 * c.w + 20]);
}

void test_graph_redraws_per_sample()
{
	theme t = load_theme();
	Compositor comp(t);
	StatCache cache;
	comp.renderAll(cache.snapshot());
	comp.surface().takeDirty();

	for (int i=0; i<7; i++) {
		cache.put("s.g", stat_value::num(10), (uint64_t)i);
		TEST_ASSERT_EQUAL_size_t_MESSAGE(1, comp.renderDue({ 2 }, cache.snapshot()).size(), "Each new sample redraws the graph");
	}
	TEST_ASSERT_EQUAL_size_t_MESSAGE(5, comp.state(2).history.size(), "History holds at most its configured length");
	TEST_ASSERT_EQUAL_size_t(0, comp.renderDue({ 2 }, cache.snapshot()).size());

	cache.put("s.g", stat_value::str("n/a"), 9);
	TEST_ASSERT_EQUAL_size_t_MESSAGE(0, comp.renderDue({ 2 }, cache.snapshot()).size(), "Non-numeric samples are skipped");
	TEST_ASSERT_EQUAL_size_t(5, comp.state(2).history.size());
}

void test_force_redraw()
{
	theme t = load_theme();
	Compositor comp(t);
	StatCache cache;
	comp.renderAll(cache.snapshot());
	comp.surface().takeDirty();
	comp.forceRedraw();
	std::vector<rect_u32> out = comp.renderDue({ 0, 3 }, cache.snapshot());
	TEST_ASSERT_EQUAL_size_t(2, out.size());
	TEST_ASSERT_TRUE(same_rect(t.widgets[0].box, out[0]));
	TEST_ASSERT_TRUE(same_rect(t.widgets[3].box, out[1]));
}

} // namespace incremental

namespace flushing {

void test_touching_dirty_rects_are_merged()
{
	std::vector<rect_u32> in(3);
	in[0].x = 0;  in[0].y = 0; in[0].w = 10; in[0].h = 10;
	in[1].x = 10; in[1].y = 0; in[1].w = 10; in[1].h = 10;
	in[2].x = 50; in[2].y = 50; in[2].w = 5; in[2].h = 5;
	std::vector<rect_u32> out = merge_rects(in);
	TEST_ASSERT_EQUAL_size_t(2, out.size());
	TEST_ASSERT_EQUAL_UINT32(20, out[0].w);
	TEST_ASSERT_EQUAL_UINT32(10, out[0].h);
}

void test_batch_copies_canvas_pixels()
{
	theme t = load_theme();
	Compositor comp(t);
	StatCache cache;
	comp.renderAll(cache.snapshot());
	std::vector<rect_u32> dirty(1, t.widgets[3].box);

	flush_batch partial = build_flush_batch(comp.surface(), dirty, false, true);
	TEST_ASSERT_FALSE(partial.full);
	TEST_ASSERT_EQUAL_size_t(1, partial.regions.size());
	TEST_ASSERT_EQUAL_size_t((size_t)40 * 10, partial.regions[0].px.size());

	flush_batch full = build_flush_batch(comp.surface(), dirty, true, true);
	TEST_ASSERT_TRUE(full.full);
	TEST_ASSERT_EQUAL_size_t(1, full.regions.size());
	TEST_ASSERT_TRUE(same_rect(comp.surface().bounds(), full.regions[0].r));
	TEST_ASSERT_EQUAL_HEX32_ARRAY(comp.surface().px.data(), full.regions[0].px.data(), comp.surface().px.size());
}

} // namespace flushing

int main(int argc, char **argv)
{
	(void)argc; (void)argv;
	UNITY_BEGIN();

	RUN_TEST(full_render::test_render_all_dirties_whole_canvas);
	RUN_TEST(full_render::test_unavailable_values_draw_fallback);

	RUN_TEST(incremental::test_unchanged_values_are_not_redrawn);
	RUN_TEST(incremental::test_only_changed_widget_is_dirty);
	RUN_TEST(incremental::test_widget_not_due_is_not_redrawn);
	RUN_TEST(incremental::test_bar_fill_pixels);
	RUN_TEST(incremental::test_graph_redraws_per_sample);
	RUN_TEST(incremental::test_force_redraw);

	RUN_TEST(flushing::test_touching_dirty_rects_are_merged);
	RUN_TEST(flushing::test_batch_copies_canvas_pixels);

	return UNITY_END();
}
