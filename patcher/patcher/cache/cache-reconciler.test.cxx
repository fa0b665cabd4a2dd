#include <patcher/cache/cache-reconciler.hxx>

#include <cassert>
#include <vector>
#include <fstream>
#include <iostream>

using namespace std;
using namespace patcher;

static fs::path
scratch ()
{
  fs::path d (fs::temp_directory_path () / "patcher-reconciler-test");
  fs::remove_all (d);
  fs::create_directories (d);
  return d;
}

static void
touch (const fs::path& p)
{
  ofstream ofs (p, ios::binary | ios::trunc);
  ofs << p.filename ().string ();
}

static manifest_entries
entries (const fs::path& root, const vector<string>& ps)
{
  manifest_entries es;
  for (const auto& p: ps)
    es.emplace_back (fs::path (p), "/" + p, "h", 1);

  return resolve_entries (es, root, "http://localhost/Patch");
}

// Counts confirmation requests and answers with a canned value.
//
struct canned_confirm
{
  bool answer;
  size_t asked = 0;
  bool last_default = true;

  confirm_callback
  callback ()
  {
    return [this] (const string&, bool def)
    {
      ++asked;
      last_default = def;
      return answer;
    };
  }
};

// Nothing in the cache beyond what the file list has: no-op.
//
static void
test_nothing ()
{
  fs::path d (scratch ());
  manifest_entries es (entries (d, {"a", "b"}));

  hash_map c {{es[0].key (), "h"}, {es[1].key (), "h"}};

  canned_confirm cf {true};
  reconciler r (nullptr, cf.callback ());

  assert (!r.reconcile (c, es));
  assert (!r.reconcile (hash_map (), es));
  assert (cf.asked == 0);
}

// A handful of orphans is removed without asking. One of them is already
// gone, which is reported but still part of the result.
//
static void
test_small ()
{
  fs::path d (scratch ());
  manifest_entries es (entries (d, {"keep"}));

  touch (d / "keep");
  touch (d / "old1");
  touch (d / "old2");

  hash_map c {{es[0].key (),              "h"},
              {cache_key (d / "old1"),    "h"},
              {cache_key (d / "old2"),    "h"},
              {cache_key (d / "vanished"), "h"}};

  size_t missing (0);
  canned_confirm cf {false};
  reconciler r ([&missing] (const sync_event& e)
                {
                  if (e.kind == event_kind::delete_missing)
                    ++missing;
                },
                cf.callback ());

  removed_paths rs (r.reconcile (c, es));

  assert (rs);
  assert (rs->size () == 3);
  assert (cf.asked == 0);
  assert (missing == 1);

  assert (fs::exists (d / "keep"));
  assert (!fs::exists (d / "old1"));
  assert (!fs::exists (d / "old2"));

  // Idempotent: running again only reports discrepancies.
  //
  rs = r.reconcile (c, es);
  assert (rs && rs->size () == 3);
  assert (missing == 4);
}

// More than ten candidates requires confirmation with a "no" default, and
// declining leaves everything in place.
//
static void
test_confirm ()
{
  fs::path d (scratch ());
  manifest_entries es (entries (d, {"keep"}));
  touch (d / "keep");

  hash_map c {{es[0].key (), "h"}};
  for (int i (0); i != 11; ++i)
  {
    fs::path p (d / ("old" + to_string (i)));
    touch (p);
    c[cache_key (p)] = "h";
  }

  // Declined.
  //
  {
    canned_confirm cf {false};
    reconciler r (nullptr, cf.callback ());

    assert (!r.reconcile (c, es));
    assert (cf.asked == 1);
    assert (cf.last_default == false);

    for (int i (0); i != 11; ++i)
      assert (fs::exists (d / ("old" + to_string (i))));
  }

  // No way to ask means no.
  //
  {
    reconciler r;
    assert (!r.reconcile (c, es));
    assert (fs::exists (d / "old0"));
  }

  // Accepted.
  //
  {
    canned_confirm cf {true};
    reconciler r (nullptr, cf.callback ());

    removed_paths rs (r.reconcile (c, es));
    assert (rs && rs->size () == 11);
    assert (cf.asked == 1);

    for (int i (0); i != 11; ++i)
      assert (!fs::exists (d / ("old" + to_string (i))));

    assert (fs::exists (d / "keep"));
  }
}

// Exactly at the threshold no confirmation is needed.
//
static void
test_threshold ()
{
  fs::path d (scratch ());
  manifest_entries es (entries (d, {}));

  hash_map c;
  for (int i (0); i != 10; ++i)
  {
    fs::path p (d / ("old" + to_string (i)));
    touch (p);
    c[cache_key (p)] = "h";
  }

  canned_confirm cf {false};
  reconciler r (nullptr, cf.callback ());

  removed_paths rs (r.reconcile (c, es));
  assert (rs && rs->size () == 10);
  assert (cf.asked == 0);
}

// Whatever the combination of cache and file list, a listed path is never
// deleted.
//
static void
test_never_listed ()
{
  const vector<string> all {"a", "b", "c", "d", "e"};

  for (unsigned lm (0); lm != 32; ++lm)
  {
    for (unsigned cm (0); cm != 32; ++cm)
    {
      fs::path d (scratch ());

      vector<string> listed;
      hash_map c;

      for (size_t i (0); i != all.size (); ++i)
      {
        touch (d / all[i]);

        if (lm & (1u << i))
          listed.push_back (all[i]);

        if (cm & (1u << i))
          c[cache_key (d / all[i])] = "h";
      }

      manifest_entries es (entries (d, listed));

      canned_confirm cf {true};
      reconciler r (nullptr, cf.callback ());
      removed_paths rs (r.reconcile (c, es));

      for (const auto& e: es)
      {
        assert (fs::exists (*e.local_path));

        if (rs)
          for (const auto& p: *rs)
            assert (p != e.key ());
      }
    }
  }
}

// Failing to ask counts as no.
//
static void
test_confirm_failure ()
{
  fs::path d (scratch ());
  manifest_entries es (entries (d, {}));

  hash_map c;
  for (int i (0); i != 11; ++i)
  {
    fs::path p (d / ("old" + to_string (i)));
    touch (p);
    c[cache_key (p)] = "h";
  }

  vector<sync_event> evs;
  reconciler r ([&evs] (const sync_event& e) {evs.push_back (e);},
                [] (const string&, bool) -> bool
                {
                  throw ios_base::failure ("unable to read y/n answer");
                });

  assert (!r.reconcile (c, es));

  for (const auto& kv: c)
    assert (fs::exists (fs::path (kv.first)));

  size_t errors (0);
  for (const auto& e: evs)
    if (e.kind == event_kind::deletion_declined &&
        e.level == event_level::error)
      ++errors;
  assert (errors == 1);
}

int
main ()
{
  test_nothing ();
  test_small ();
  test_confirm ();
  test_threshold ();
  test_confirm_failure ();
  test_never_listed ();

  fs::remove_all (fs::temp_directory_path () / "patcher-reconciler-test");
}
