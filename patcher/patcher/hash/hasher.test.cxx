#include <patcher/hash/hasher.hxx>

#include <cassert>
#include <fstream>
#include <iostream>
#include <stdexcept>

using namespace std;
using namespace patcher;

// Reference digests (FIPS 180-2 test vectors).
//
static const string empty_digest (
  "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");

static const string abc_digest (
  "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");

static const string million_a_digest (
  "cdc76e5c9914fb9281a1c7e284d73e67f1809a48a497200e046d39ccc7112cd0");

static fs::path
scratch ()
{
  fs::path d (fs::temp_directory_path () / "patcher-hasher-test");
  fs::remove_all (d);
  fs::create_directories (d);
  return d;
}

static fs::path
write (const fs::path& p, const string& s)
{
  ofstream ofs (p, ios::binary | ios::trunc);
  ofs << s;
  return p;
}

// Portable digests of known inputs, including one that spans many 8 KiB
// chunks and does not end on a chunk boundary.
//
static void
test_portable ()
{
  fs::path d (scratch ());

  fs::path e (write (d / "empty", ""));
  fs::path a (write (d / "abc", "abc"));
  fs::path m (write (d / "million", string (1000000, 'a')));

  assert (compute_file_hash (e) == empty_digest);
  assert (compute_file_hash (a) == abc_digest);
  assert (compute_file_hash (m) == million_a_digest);

  hasher_traits<> t;
  t.native_tool.clear ();

  hasher h (t);
  hash_map r (h.hash ({e, a, m}));

  assert (r.size () == 3);
  assert (r[cache_key (e)] == empty_digest);
  assert (r[cache_key (a)] == abc_digest);
  assert (r[cache_key (m)] == million_a_digest);
  assert (h.last_strategy () == hash_strategy::portable);
}

// Whichever strategy the platform ends up using, the digests must be the
// same as the portable ones.
//
static void
test_default ()
{
  fs::path d (scratch ());

  vector<fs::path> ps;
  for (int i (0); i != 16; ++i)
    ps.push_back (write (d / ("f" + to_string (i)), string (i * 1000, 'x')));

  ps.push_back (write (d / "abc", "abc"));

  hasher h;
  hash_map r (h.hash (ps));

  assert (r.size () == ps.size ());
  assert (h.last_strategy ());

  for (const auto& p : ps)
    assert (r[cache_key (p)] == compute_file_hash (p));

  assert (r[cache_key (d / "abc")] == abc_digest);
}

// A tool that cannot be found must result in a transparent fallback for the
// whole batch.
//
static void
test_fallback ()
{
  fs::path d (scratch ());
  fs::path a (write (d / "abc", "abc"));
  fs::path e (write (d / "empty", ""));

  hasher_traits<> t;
  t.native_tool = "patcher-no-such-digest-tool";

  size_t fallbacks (0);
  hasher h (t, [&fallbacks] (const sync_event& e)
  {
    if (e.kind == event_kind::hash_fallback)
      ++fallbacks;
  });

  hash_map r (h.hash ({a, e}));

  assert (r.size () == 2);
  assert (r[cache_key (a)] == abc_digest);
  assert (r[cache_key (e)] == empty_digest);
  assert (h.last_strategy () == hash_strategy::portable);
  assert (fallbacks != 0);
}

// An unreadable file is fatal for the portable strategy.
//
static void
test_unreadable ()
{
  fs::path d (scratch ());

  hasher_traits<> t;
  t.native_tool.clear ();

  hasher h (t);

  bool thrown (false);
  try
  {
    h.hash ({d / "does-not-exist"});
  }
  catch (const runtime_error&)
  {
    thrown = true;
  }

  assert (thrown);

  // Empty batch is not an error and does not touch the strategy.
  //
  assert (h.hash ({}).empty ());
  assert (!h.last_strategy ());
}

static void
test_parse_digest_line ()
{
  auto p ([] (const string& l) { return hasher::parse_digest_line (l); });

  assert (p (abc_digest + "  /tmp/abc") == abc_digest);
  assert (p (abc_digest + " */tmp/abc") == abc_digest);
  assert (p ("\\" + abc_digest + "  /tmp/a\\nb") == abc_digest);
  assert (p (abc_digest) == abc_digest);

  string u (abc_digest);
  for (auto& c : u)
    c = static_cast<char> (toupper (static_cast<unsigned char> (c)));

  assert (p (u + "  x") == abc_digest);

  assert (!p (""));
  assert (!p ("abc  /tmp/abc"));
  assert (!p (abc_digest.substr (1) + "  x"));
  assert (!p (abc_digest + "0  x"));
  assert (!p ("sha256sum: x: No such file or directory"));
}

int
main ()
{
  test_portable ();
  test_default ();
  test_fallback ();
  test_unreadable ();
  test_parse_digest_line ();

  fs::remove_all (fs::temp_directory_path () / "patcher-hasher-test");
}
