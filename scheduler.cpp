#include "scheduler.h"

const uint64_t Scheduler::kNever;

void Scheduler::add(size_t widget, uint32_t interval_ms, uint64_t first_due) {
  if (interval_ms == 0) return;
  schedule_entry e;
  e.widget = widget;
  e.interval_ms = interval_ms;
  e.next_due = first_due;
  entries_.push_back(e);
}

std::vector<size_t> Scheduler::tick(uint64_t now) {
  std::vector<size_t> due;
  for (schedule_entry &e : entries_) {
    if (e.next_due > now) continue;
    due.push_back(e.widget);
    e.next_due += e.interval_ms;
    if (e.next_due <= now) {
      uint64_t behind = (now - e.next_due) / e.interval_ms + 1;
      e.next_due += behind * e.interval_ms;
    }
  }
  return due;
}

uint64_t Scheduler::nextDue() const {
  uint64_t best = kNever;
  for (const schedule_entry &e : entries_) {
    if (e.next_due < best) best = e.next_due;
  }
  return best;
}
