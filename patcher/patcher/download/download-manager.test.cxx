#include <patcher/download/download-manager.hxx>

#include <map>
#include <chrono>
#include <cassert>
#include <fstream>
#include <sstream>
#include <iostream>
#include <stdexcept>
#include <exception>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/steady_timer.hpp>

using namespace std;
using namespace patcher;

// Serves bodies from memory, a few bytes at a time, yielding to the
// io_context between chunks so that transfers interleave.
//
struct memory_transport
{
  asio::io_context& ioc;
  map<string, string> bodies;

  size_t chunk = 3;
  size_t in_flight = 0;
  size_t peak = 0;
  size_t calls = 0;

  explicit
  memory_transport (asio::io_context& c): ioc (c) {}

  asio::awaitable<uint64_t>
  download_file (const string& url, const fs::path& p, transfer_callback cb)
  {
    ++calls;
    peak = max (peak, ++in_flight);

    asio::steady_timer t (ioc, chrono::milliseconds (5));
    co_await t.async_wait (asio::use_awaitable);

    auto i (bodies.find (url));
    if (i == bodies.end ())
    {
      --in_flight;
      throw runtime_error ("HTTP 404 Not Found");
    }

    const string& b (i->second);
    ofstream ofs (p, ios::binary | ios::trunc);

    for (size_t n (0); n < b.size (); )
    {
      size_t k (min (chunk, b.size () - n));
      ofs.write (b.data () + n, static_cast<streamsize> (k));
      n += k;

      if (cb)
        cb (n, b.size ());

      asio::steady_timer y (ioc, chrono::milliseconds (1));
      co_await y.async_wait (asio::use_awaitable);
    }

    --in_flight;
    co_return b.size ();
  }
};

using manager = basic_download_manager<
  download_manager_traits<memory_transport>>;

static fs::path
scratch ()
{
  fs::path d (fs::temp_directory_path () / "patcher-download-test");
  fs::remove_all (d);
  fs::create_directories (d);
  return d;
}

static string
read (const fs::path& p)
{
  ifstream ifs (p, ios::binary);
  ostringstream os;
  os << ifs.rdbuf ();
  return os.str ();
}

static void
run (asio::io_context& ioc, manager& m)
{
  asio::co_spawn (ioc, m.download_all (), [] (exception_ptr e)
  {
    if (e)
      rethrow_exception (e);
  });

  ioc.run ();
}

// Ten files through three slots.
//
static void
test_bounded ()
{
  fs::path d (scratch ());

  asio::io_context ioc;
  memory_transport tr (ioc);

  for (int i (0); i != 10; ++i)
    tr.bodies["http://x/f" + to_string (i)] =
      string (20 + i, static_cast<char> ('a' + i));

  manager m (ioc, tr, 3);

  for (int i (0); i != 10; ++i)
    m.add_task (download_request ("http://x/f" + to_string (i),
                                  d / "sub" / ("f" + to_string (i)),
                                  20 + i,
                                  "f" + to_string (i)));

  size_t notified (0);
  m.set_task_completion_callback ([&notified] (auto) {++notified;});

  run (ioc, m);

  assert (tr.calls == 10);
  assert (tr.peak == 3);
  assert (m.peak_parallel () == 3);
  assert (m.completed_count () == 10);
  assert (m.failed_count () == 0);
  assert (m.active_count () == 0);
  assert (notified == 10);

  for (int i (0); i != 10; ++i)
    assert (read (d / "sub" / ("f" + to_string (i))) ==
            string (20 + i, static_cast<char> ('a' + i)));

  fs::remove_all (d);
}

// One unreachable file does not stop the rest, and the shared counters add
// up across transfers.
//
static void
test_isolation ()
{
  fs::path d (scratch ());

  asio::io_context ioc;
  memory_transport tr (ioc);
  tr.bodies["http://x/a"] = "hello";
  tr.bodies["http://x/c"] = string (100, 'c');

  vector<sync_event> es;
  manager m (ioc, tr, 4, [&es] (const sync_event& e) {es.push_back (e);});

  progress_metrics pm;
  m.set_metrics (&pm);

  auto a (m.add_task (download_request ("http://x/a", d / "a", 5, "a")));
  auto b (m.add_task (download_request ("http://x/b", d / "b", 7, "b")));
  auto c (m.add_task (download_request ("http://x/c", d / "c", 100, "c")));

  run (ioc, m);

  assert (a->completed ());
  assert (b->failed ());
  assert (c->completed ());
  assert (b->error.message == "HTTP 404 Not Found");
  assert (b->error.url == "http://x/b");
  assert (!fs::exists (d / "b"));
  assert (read (d / "c") == string (100, 'c'));

  assert (pm.total_bytes == 112);
  assert (pm.current_bytes == 105);
  assert (pm.total_items == 3);
  assert (pm.completed_items == 2);
  assert (pm.failed_items == 1);
  assert (pm.state == progress_state::failed);

  assert (m.total_bytes () == 112);
  assert (m.downloaded_bytes () == 105);

  size_t failed (0);
  for (const auto& e: es)
  {
    if (e.kind == event_kind::download_failed)
    {
      ++failed;
      assert (e.level == event_level::error);
      assert (e.path == (d / "b").string ());
    }
  }
  assert (failed == 1);

  fs::remove_all (d);
}

static void
test_empty ()
{
  asio::io_context ioc;
  memory_transport tr (ioc);

  manager m (ioc, tr, 0);
  assert (m.max_parallel () == 1);

  progress_metrics pm;
  m.set_metrics (&pm);

  run (ioc, m);

  assert (tr.calls == 0);
  assert (pm.state == progress_state::idle);

  // A request without a URL fails without reaching the transport.
  //
  asio::io_context ioc2;
  memory_transport tr2 (ioc2);
  manager m2 (ioc2, tr2);

  auto t (m2.add_task (download_request ("", "x")));
  run (ioc2, m2);

  assert (t->failed ());
  assert (tr2.calls == 0);
}

int
main ()
{
  test_bounded ();
  test_isolation ();
  test_empty ();

  cout << "all download tests passed" << endl;
}
