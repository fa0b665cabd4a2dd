#include <patcher/progress/progress-tracker.hxx>

#include <cmath>
#include <cassert>
#include <iostream>

using namespace std;
using namespace patcher;

using traits = progress_tracker_traits<>;

static void
test_format ()
{
  assert (traits::format_bytes (0) == "0 B");
  assert (traits::format_bytes (1023) == "1023 B");
  assert (traits::format_bytes (1024) == "1.0 KiB");
  assert (traits::format_bytes (1536) == "1.5 KiB");
  assert (traits::format_bytes (5 * 1024 * 1024) == "5.0 MiB");
  assert (traits::format_bytes (3ULL * 1024 * 1024 * 1024) == "3.0 GiB");

  assert (traits::format_speed (0.0f) == "0 B/s");
  assert (traits::format_speed (2048.0f) == "2.0 KiB/s");
  assert (traits::format_speed (-5.0f) == "0 B/s");

  assert (traits::format_duration (0) == "00m00s");
  assert (traits::format_duration (65) == "01m05s");
  assert (traits::format_duration (3725) == "1h02m05s");

  assert (traits::format_bar (0.0f, false, 4) == "[    ]");
  assert (traits::format_bar (0.5f, false, 4) == "[=>  ]");
  assert (traits::format_bar (1.0f, false, 4) == "[===>]");
  assert (traits::format_bar (2.0f, false, 4) == "[===>]");
  assert (traits::format_bar (0.0f, true, 4) == "[  > ]");
}

static void
test_speed ()
{
  progress_tracker t;
  assert (t.speed () == 0.0f);

  // Baseline, then one second later 1000 more bytes.
  //
  t.update (0, 1000000);
  assert (t.speed () == 0.0f);

  t.update (1000, 2000000);
  assert (fabs (t.speed () - 1000.0f) < 0.01f);

  // Too close to the previous sample: ignored.
  //
  t.update (50000, 2100000);
  assert (fabs (t.speed () - 1000.0f) < 0.01f);

  // 2000 B/s over the next second moves the average by alpha.
  //
  t.update (3000, 3000000);
  assert (fabs (t.speed () - 1200.0f) < 0.01f);

  t.reset ();
  assert (t.speed () == 0.0f);
}

static void
test_snapshot ()
{
  progress_metrics m;
  m.reset (2048, 4);
  m.current_bytes.fetch_add (512);
  m.current_bytes.fetch_add (512);
  m.completed_items.fetch_add (1);
  m.speed.store (256.0f);

  progress_snapshot s (m);
  assert (s.total_bytes == 2048);
  assert (s.current_bytes == 1024);
  assert (s.total_items == 4);
  assert (s.state == progress_state::active);
  assert (fabs (s.progress_ratio () - 0.5f) < 0.001f);
  assert (s.eta_seconds () == 4);

  progress_formatter f (4);
  assert (f.format (s) == "[=>  ]  50% 1.0 KiB / 2.0 KiB @ 256 B/s ETA 00m04s");

  // More bytes than announced.
  //
  m.current_bytes.fetch_add (4096);
  progress_snapshot o (m);
  assert (o.progress_ratio () == 1.0f);
  assert (o.eta_seconds () == 0);

  // Unknown total.
  //
  progress_snapshot e;
  assert (e.progress_ratio () == 0.0f);
  assert (f.format_stats (e) == "  0% 0 B / 0 B");
}

int
main ()
{
  test_format ();
  test_speed ();
  test_snapshot ();

  cout << "all progress tests passed" << endl;
}
