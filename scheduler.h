#pragma once
#include <stddef.h>
#include <stdint.h>
#include <vector>

struct schedule_entry {
  size_t widget = 0;                    // index into theme.widgets
  uint32_t interval_ms = 0;
  uint64_t next_due = 0;
};

// Due-set computation for refreshing widgets. Entries keep declaration order.
class Scheduler {
public:
  static const uint64_t kNever = ~0ull;

  // interval 0 is ignored: such widgets are drawn once by the initial full render.
  void add(size_t widget, uint32_t interval_ms, uint64_t first_due);

  // Every entry with next_due <= now, in declaration order. Each is advanced by whole
  // intervals until next_due > now, so a stall yields one redraw, not a burst.
  std::vector<size_t> tick(uint64_t now);

  // Earliest next_due, kNever when empty.
  uint64_t nextDue() const;

  const std::vector<schedule_entry> &entries() const { return entries_; }

private:
  std::vector<schedule_entry> entries_;
};
