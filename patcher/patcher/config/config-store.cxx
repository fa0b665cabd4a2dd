#include <patcher/config/config-store.hxx>

#include <cstdlib>
#include <fstream>
#include <sstream>
#include <system_error>

#include <boost/json.hpp>

using namespace std;

namespace patcher
{
  namespace json = boost::json;

  fs::path
  user_data_dir ()
  {
    auto env = [] (const char* n) -> const char*
    {
      const char* v (getenv (n));
      return v != nullptr && *v != '\0' ? v : nullptr;
    };

#ifdef _WIN32
    if (const char* a = env ("APPDATA"))
      return fs::path (a) / "patcher";
#elif defined(__APPLE__)
    if (const char* h = env ("HOME"))
      return fs::path (h) / "Library" / "Application Support" / "patcher";
#else
    if (const char* x = env ("XDG_DATA_HOME"))
      return fs::path (x) / "patcher";

    if (const char* h = env ("HOME"))
      return fs::path (h) / ".local" / "share" / "patcher";
#endif

    return fs::current_path () / ".patcher";
  }

  fs::path
  default_config_path ()
  {
    fs::path l ("config.json");

    error_code ec;
    if (fs::exists (l, ec))
      return l;

    return user_data_dir () / "config.json";
  }

  patcher_config config_store::
  parse (const string& s)
  {
    boost::system::error_code ec;
    json::value v (json::parse (s, ec));

    if (ec)
      throw config_error ("invalid JSON: " + ec.message ());

    if (!v.is_object ())
      throw config_error ("configuration is not a JSON object");

    const json::object& o (v.as_object ());

    auto str = [&o] (const char* n) -> string
    {
      auto i (o.find (n));

      if (i == o.end ())
        throw config_error (string ("missing member '") + n + "'");

      if (!i->value ().is_string ())
        throw config_error (string ("member '") + n + "' is not a string");

      return json::value_to<string> (i->value ());
    };

    patcher_config r;
    r.root_domain = str ("root_domain");
    r.output_dir = str ("output_dir");

    if (auto i = o.find ("hashes"); i != o.end ())
    {
      if (!i->value ().is_object ())
        throw config_error ("member 'hashes' is not an object");

      hash_map hs;
      for (const auto& kv: i->value ().as_object ())
      {
        string k (kv.key ().data (), kv.key ().size ());

        if (!kv.value ().is_string ())
          throw config_error ("hash for '" + k + "' is not a string");

        hs.emplace (move (k), json::value_to<string> (kv.value ()));
      }

      r.hashes = move (hs);
    }

    return r;
  }

  string config_store::
  serialize (const patcher_config& c)
  {
    json::object o;
    o["root_domain"] = c.root_domain;
    o["output_dir"] = c.output_dir;

    if (c.hashes)
    {
      json::object hs;
      for (const auto& [k, v]: *c.hashes)
        hs[k] = v;

      o["hashes"] = move (hs);
    }

    return json::serialize (o);
  }

  patcher_config config_store::
  load (const optional<string>& root_domain,
        const optional<string>& output_dir)
  {
    error_code ec;
    if (!fs::exists (file_, ec))
    {
      emit (sink_,
            event_kind::config_changed,
            event_level::info,
            "no config file detected, generating new file",
            file_.string ());

      patcher_config c (generate (root_domain, output_dir));
      save (c);
      return c;
    }

    emit (sink_,
          event_kind::config_changed,
          event_level::trace,
          "loading config file " + file_.string (),
          file_.string ());

    string text;
    {
      ifstream ifs (file_, ios::binary);

      if (!ifs)
        throw config_error ("unable to open " + file_.string ());

      ostringstream os;
      os << ifs.rdbuf ();
      text = os.str ();
    }

    patcher_config c;
    try
    {
      c = parse (text);
    }
    catch (const config_error& e)
    {
      emit (sink_,
            event_kind::config_changed,
            event_level::warning,
            "the current config is invalid (" + string (e.what ()) +
            "), generating a new one",
            file_.string ());

      c = generate (root_domain, output_dir);
      save (c);
      return c;
    }

    bool changed (false);

    if (root_domain && *root_domain != c.root_domain)
    {
      emit (sink_,
            event_kind::config_changed,
            event_level::info,
            "new value for root-domain passed, overwriting old value "
            "present in config");

      c.root_domain = *root_domain;
      changed = true;
    }

    if (output_dir && *output_dir != c.output_dir)
    {
      emit (sink_,
            event_kind::config_changed,
            event_level::info,
            "new value for output-dir passed, overwriting old value "
            "present in config");

      c.output_dir = *output_dir;
      changed = true;
    }

    if (changed)
      save (c);

    return c;
  }

  void config_store::
  save (const patcher_config& c) const
  {
    if (file_.has_parent_path ())
    {
      error_code ec;
      fs::create_directories (file_.parent_path (), ec);

      if (ec)
        throw config_error ("unable to create " +
                            file_.parent_path ().string () + ": " +
                            ec.message ());
    }

    ofstream ofs (file_, ios::binary | ios::trunc);

    if (!ofs)
      throw config_error ("failed to open config file for writing: " +
                          file_.string ());

    ofs << serialize (c);

    if (!ofs)
      throw config_error ("failed to write config file " + file_.string ());
  }

  bool config_store::
  update_hashes (patcher_config& c, const sync_outcome& o) const
  {
    if (!o.hashes && !o.downloaded && !o.deleted)
    {
      emit (sink_,
            event_kind::config_changed,
            event_level::info,
            "no new hashes found");
      return false;
    }

    if (!c.hashes)
      c.hashes = hash_map ();

    hash_map& hs (*c.hashes);
    bool changed (false);

    auto merge = [this, &hs, &changed] (const hash_map& m)
    {
      for (const auto& [k, v]: m)
      {
        auto i (hs.find (k));

        if (i == hs.end ())
        {
          emit (sink_,
                event_kind::config_changed,
                event_level::trace,
                "new hash found for " + k,
                k);

          hs.emplace (k, v);
          changed = true;
        }
        else if (i->second != v)
        {
          emit (sink_,
                event_kind::config_changed,
                event_level::trace,
                "hash changed for " + k,
                k);

          i->second = v;
          changed = true;
        }
      }
    };

    if (o.hashes)
      merge (*o.hashes);

    if (o.downloaded)
      merge (*o.downloaded);

    if (o.deleted)
    {
      for (const auto& kv: *o.deleted)
      {
        if (hs.erase (kv.first) != 0)
        {
          emit (sink_,
                event_kind::config_changed,
                event_level::trace,
                "forgetting hash for deleted " + kv.first,
                kv.first);

          changed = true;
        }
      }
    }

    return changed;
  }

  patcher_config config_store::
  generate (const optional<string>& root_domain,
            const optional<string>& output_dir)
  {
    patcher_config c;

    c.root_domain = root_domain
      ? *root_domain
      : ask ("root domain", "Please specify the root domain to use: ");

    c.output_dir = output_dir
      ? *output_dir
      : ask ("output directory", "Please specify the output directory: ");

    return c;
  }

  string config_store::
  ask (const string& what, const string& q)
  {
    if (!prompt_)
      throw config_error ("no " + what + " specified");

    string r (prompt_ (q));

    if (r.empty ())
      throw config_error ("no " + what + " specified");

    return r;
  }
}
