#include <string>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <exception>
#include <filesystem>

#include <boost/asio.hpp>
#include <boost/asio/co_spawn.hpp>

#include <patcher/sync/sync-types.hxx>
#include <patcher/sync/synchronizer.hxx>
#include <patcher/event/event-types.hxx>
#include <patcher/config/config-store.hxx>

#include <patcher/patcher-sync.hxx>
#include <patcher/patcher-options.hxx>

#include <patcher/version.hxx>

using namespace std;
namespace fs = filesystem;
namespace asio = boost::asio;

namespace patcher
{
  // Prompt the user for a Yes/No answer.
  //
  // An empty line selects the default. EOF without an answer is an error
  // rather than consent.
  //
  static bool
  confirm_action (const string& prompt, bool def)
  {
    string a;
    do
    {
      cout << prompt << (def ? " [Y/n]" : " [y/N]") << ' ' << flush;

      getline (cin, a);

      bool f (cin.fail ());
      bool e (cin.eof ());

      if (f || e)
        cout << endl;

      if (f)
        throw ios_base::failure ("unable to read y/n answer from stdin");

      if (a.empty () && !e)
        return def;

    } while (a != "y" && a != "Y" && a != "n" && a != "N");

    return a == "y" || a == "Y";
  }

  // Ask for a free-form value.
  //
  static string
  prompt_value (const string& q)
  {
    cout << q << flush;

    string a;
    getline (cin, a);

    if (cin.fail ())
    {
      cout << endl;
      throw ios_base::failure ("unable to read answer from stdin");
    }

    return a;
  }

  // Log level from the command line or the environment.
  //
  static optional<event_level>
  resolve_log_level (const options& o)
  {
    string s;

    if (o.log_level_specified ())
      s = o.log_level ();
    else if (const char* e = getenv ("PATCHER_LOG_LEVEL"))
      s = e;

    if (s.empty ())
      return event_level::info;

    return to_event_level (s);
  }
}

int
main (int argc, char* argv[])
{
  using namespace patcher;

  try
  {
    options opt (argc, argv);

    // Handle --version.
    //
    if (opt.version ())
    {
      cout << "patcher " << PATCHER_VERSION_ID << "\n";
      return 0;
    }

    // Handle --help.
    //
    if (opt.help ())
    {
      auto& o (cout);

      o << "usage: patcher [options]" << "\n"
        << "options:"                 << "\n";

      opt.print_usage (o);

      return 0;
    }

    optional<event_level> lvl (resolve_log_level (opt));

    if (!lvl)
    {
      cerr << "error: invalid log level, expected one of trace, info, "
           << "warning, error" << endl;
      return 1;
    }

    asio::io_context ioc;

    sync_coordinator sc (ioc,
                         *lvl,
                         [] (const string& q, bool d)
                         {
                           return confirm_action (q, d);
                         },
                         !opt.no_progress (),
                         cerr);

    sc.log (sync_event (event_kind::state_changed,
                        event_level::info,
                        string ("running patcher version ") +
                        PATCHER_VERSION_ID));

    // Load (or create) the configuration.
    //
    fs::path cf (opt.config_specified ()
                 ? fs::path (opt.config ())
                 : default_config_path ());

    config_store cs (cf, sc.sink (), &prompt_value);

    optional<string> rd;
    optional<string> od;

    if (opt.root_domain_specified ())
      rd = opt.root_domain ();

    if (opt.output_dir_specified ())
      od = opt.output_dir ();

    patcher_config cfg (cs.load (rd, od));

    sync_options so;
    so.root_domain = cfg.root_domain;
    so.output_dir = fs::absolute (fs::path (cfg.output_dir));
    so.validate = opt.validate ();
    so.remove_stale = opt.delete_files ();
    so.jobs = opt.jobs ();

    // Run the synchronization.
    //
    optional<sync_outcome> r;
    exception_ptr ex;

    asio::co_spawn (
      ioc,
      sc.run (so, cfg.hashes),
      [&r, &ex] (exception_ptr e, sync_outcome o)
      {
        if (e)
          ex = e;
        else
          r = move (o);
      });

    ioc.run ();

    if (ex)
      rethrow_exception (ex);

    // Persist whatever we learned, even if some downloads failed: the
    // files that did arrive need not be fetched again.
    //
    if (cs.update_hashes (cfg, *r))
      cs.save (cfg);

    if (!r->succeeded ())
    {
      cerr << "error: " << r->failed.size () << " file(s) could not be "
           << "downloaded" << endl;
      return 1;
    }

    return 0;
  }
  catch (const cli::exception& ex)
  {
    cerr << "error: " << ex.what () << "\n";
    return 1;
  }
  catch (const exception& ex)
  {
    cerr << "error: " << ex.what () << "\n";
    return 1;
  }
}
