#include <patcher/config/config-store.hxx>

#include <vector>
#include <cassert>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <iostream>

using namespace std;
using namespace patcher;

static fs::path
scratch ()
{
  fs::path d (fs::temp_directory_path () / "patcher-config-test");
  fs::remove_all (d);
  fs::create_directories (d);
  return d;
}

static void
write (const fs::path& p, const string& s)
{
  ofstream ofs (p, ios::binary | ios::trunc);
  ofs << s;
}

static string
read (const fs::path& p)
{
  ifstream ifs (p, ios::binary);
  ostringstream os;
  os << ifs.rdbuf ();
  return os.str ();
}

static bool
rejects (const string& s)
{
  try
  {
    config_store::parse (s);
  }
  catch (const config_error&)
  {
    return true;
  }
  return false;
}

static void
test_parse ()
{
  patcher_config c (config_store::parse (
    R"({"root_domain": "https://cdn.example.com", "output_dir": "/g",)"
    R"( "hashes": {"/g/a.pak": "abc"}})"));

  assert (c.root_domain == "https://cdn.example.com");
  assert (c.output_dir == "/g");
  assert (c.hashes && c.hashes->size () == 1);
  assert (c.hashes->at ("/g/a.pak") == "abc");

  patcher_config n (config_store::parse (
    R"({"root_domain": "r", "output_dir": "o"})"));
  assert (!n.hashes);

  assert (rejects ("{"));
  assert (rejects ("[]"));
  assert (rejects (R"({"root_domain": "r"})"));
  assert (rejects (R"({"root_domain": 1, "output_dir": "o"})"));
  assert (rejects (R"({"root_domain": "r", "output_dir": "o", "hashes": []})"));
  assert (rejects (
    R"({"root_domain": "r", "output_dir": "o", "hashes": {"a": 1}})"));

  // Reading back what we wrote gives the same configuration.
  //
  assert (config_store::parse (config_store::serialize (c)) == c);
  assert (config_store::parse (config_store::serialize (n)) == n);
}

// No file: both values are asked for and the result is saved.
//
static void
test_generate ()
{
  fs::path d (scratch ());
  fs::path f (d / "nested" / "config.json");

  vector<string> asked;
  auto prompt = [&asked] (const string& q) -> string
  {
    asked.push_back (q);
    return asked.size () == 1 ? "https://r.example.com" : "/out";
  };

  config_store s (f, nullptr, prompt);
  patcher_config c (s.load (nullopt, nullopt));

  assert (asked.size () == 2);
  assert (asked[0] == "Please specify the root domain to use: ");
  assert (asked[1] == "Please specify the output directory: ");
  assert (c.root_domain == "https://r.example.com");
  assert (c.output_dir == "/out");
  assert (!c.hashes);
  assert (fs::exists (f));
  assert (config_store::parse (read (f)) == c);

  // Values passed in are not asked for.
  //
  fs::remove (f);
  asked.clear ();
  patcher_config p (s.load (string ("r"), nullopt));
  assert (asked.size () == 1);
  assert (p.root_domain == "r");

  // Nothing to ask with.
  //
  fs::remove (f);
  config_store q (f);
  bool thrown (false);
  try
  {
    q.load (nullopt, nullopt);
  }
  catch (const config_error&)
  {
    thrown = true;
  }
  assert (thrown);

  fs::remove_all (d);
}

static void
test_invalid ()
{
  fs::path d (scratch ());
  fs::path f (d / "config.json");
  write (f, R"({"root_domain": "r"})");

  vector<sync_event> es;
  config_store s (f,
                  [&es] (const sync_event& e) {es.push_back (e);},
                  [] (const string&) {return string ("/asked");});

  patcher_config c (s.load (string ("https://x"), nullopt));
  assert (c.root_domain == "https://x");
  assert (c.output_dir == "/asked");

  size_t warnings (0);
  for (const auto& e: es)
    if (e.level == event_level::warning)
      ++warnings;
  assert (warnings == 1);

  assert (config_store::parse (read (f)) == c);

  fs::remove_all (d);
}

// Command line values replace stored ones but keep the hash cache.
//
static void
test_override ()
{
  fs::path d (scratch ());
  fs::path f (d / "config.json");

  patcher_config o;
  o.root_domain = "https://old";
  o.output_dir = "/g";
  o.hashes = hash_map {{"/g/a", "1"}};

  vector<sync_event> es;
  config_store s (f, [&es] (const sync_event& e) {es.push_back (e);});
  s.save (o);

  // Same values: nothing is rewritten or reported.
  //
  patcher_config same (s.load (string ("https://old"), string ("/g")));
  assert (same == o);
  for (const auto& e: es)
    assert (e.level != event_level::info);

  patcher_config c (s.load (string ("https://new"), nullopt));
  assert (c.root_domain == "https://new");
  assert (c.output_dir == "/g");
  assert (c.hashes == o.hashes);

  size_t infos (0);
  for (const auto& e: es)
    if (e.kind == event_kind::config_changed && e.level == event_level::info)
      ++infos;
  assert (infos == 1);

  assert (config_store::parse (read (f)) == c);

  fs::remove_all (d);
}

static void
test_update_hashes ()
{
  config_store s ("unused.json");

  patcher_config c;
  c.root_domain = "r";
  c.output_dir = "/g";

  // Nothing happened.
  //
  assert (!s.update_hashes (c, sync_outcome ()));
  assert (!c.hashes);

  sync_outcome o;
  o.hashes = hash_map {{"/g/a", "1"}, {"/g/orphan", "9"}};
  o.downloaded = hash_map {{"/g/a", "2"}, {"/g/b", "3"}};
  assert (s.update_hashes (c, o));
  assert ((*c.hashes == hash_map {{"/g/a", "2"},
                                  {"/g/b", "3"},
                                  {"/g/orphan", "9"}}));

  // Nothing new: no change.
  //
  sync_outcome same;
  same.hashes = hash_map {{"/g/orphan", "9"}};
  same.downloaded = o.downloaded;
  assert (!s.update_hashes (c, same));

  sync_outcome r;
  r.deleted = hash_map {{"/g/orphan", "9"}, {"/g/gone", "7"}};
  assert (s.update_hashes (c, r));
  assert ((*c.hashes == hash_map {{"/g/a", "2"}, {"/g/b", "3"}}));
}

#if !defined(_WIN32) && !defined(__APPLE__)
static void
test_location ()
{
  fs::path d (scratch ());
  fs::path cwd (fs::current_path ());

  setenv ("XDG_DATA_HOME", (d / "xdg").string ().c_str (), 1);
  assert (user_data_dir () == d / "xdg" / "patcher");

  fs::current_path (d);
  assert (default_config_path () == d / "xdg" / "patcher" / "config.json");

  write (d / "config.json", "{}");
  assert (default_config_path () == fs::path ("config.json"));

  fs::current_path (cwd);
  unsetenv ("XDG_DATA_HOME");
  fs::remove_all (d);
}
#endif

int
main ()
{
  test_parse ();
  test_generate ();
  test_invalid ();
  test_override ();
  test_update_hashes ();
#if !defined(_WIN32) && !defined(__APPLE__)
  test_location ();
#endif

  cout << "all config tests passed" << endl;
}
