#include <latch>
#include <atomic>
#include <thread>
#include <cctype>
#include <algorithm>
#include <stdexcept>

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <boost/process.hpp>

namespace patcher
{
  template <typename T>
  hash_map basic_hasher<T>::
  hash (const std::vector<fs::path>& ps)
  {
    if (ps.empty ())
      return hash_map ();

    if (!traits_.native_tool.empty ())
    {
      if (auto r = hash_native (ps))
      {
        last_ = hash_strategy::native;
        return std::move (*r);
      }

      // No partial results: whatever the tool managed to produce is thrown
      // away and the whole batch goes through the portable path.
      //
      emit (sink_,
            event_kind::hash_fallback,
            event_level::trace,
            "native hashing with " + traits_.native_tool +
            " failed, falling back to the portable implementation");
    }

    hash_map r (hash_portable (ps));
    last_ = hash_strategy::portable;
    return r;
  }

  template <typename T>
  std::size_t basic_hasher<T>::
  thread_count (std::size_t jobs) const noexcept
  {
    std::size_t n (traits_.threads);

    if (n == 0)
    {
      n = std::thread::hardware_concurrency ();
      if (n == 0) n = 4;
    }

    return std::min (n, jobs);
  }

  template <typename T>
  std::optional<typename basic_hasher<T>::string_type> basic_hasher<T>::
  parse_digest_line (const string_type& l)
  {
    // The tool prefixes the line with a backslash when the file name had to
    // be escaped. The digest itself always comes first.
    //
    std::size_t b (!l.empty () && l[0] == '\\' ? 1 : 0);

    if (l.size () < b + hash_hex_size)
      return std::nullopt;

    string_type d (l.substr (b, hash_hex_size));

    if (!valid_hash (d))
      return std::nullopt;

    // Must be followed by the separator (or nothing at all).
    //
    std::size_t e (b + hash_hex_size);
    if (e < l.size () && l[e] != ' ')
      return std::nullopt;

    std::transform (d.begin (), d.end (), d.begin (),
                    [] (unsigned char c) { return std::tolower (c); });
    return d;
  }

  template <typename T>
  typename basic_hasher<T>::string_type basic_hasher<T>::
  run_tool (const fs::path& p) const
  {
    namespace bp = boost::process;

    auto exe (bp::search_path (traits_.native_tool));
    if (exe.empty ())
      throw std::runtime_error ("unable to find " + traits_.native_tool);

    std::vector<std::string> as (traits_.native_args);
    as.push_back (p.string ());

    bp::ipstream o;
    bp::ipstream er;
    bp::child c (exe,
                 bp::args (as),
                 bp::std_out > o,
                 bp::std_err > er);

    string_type l;
    std::getline (o, l);

    // Anything on stderr means the tool is unhappy about something, even if
    // it still printed a digest.
    //
    string_type e;
    std::getline (er, e);

    c.wait ();

    if (c.exit_code () != 0 || !e.empty ())
      throw std::runtime_error (traits_.native_tool + " failed for " +
                                p.string () + ": " + e);

    auto d (parse_digest_line (l));
    if (!d)
      throw std::runtime_error ("unexpected " + traits_.native_tool +
                                " output for " + p.string ());

    return *d;
  }

  // One unit of work for the pool. Results are written by the worker and
  // read back after the latch is released.
  //
  struct hash_job
  {
    fs::path    path;
    std::string digest;
    std::string error; // Non-empty if the job failed.
  };

  template <typename F>
  inline void
  run_hash_jobs (std::vector<hash_job>& js, std::size_t threads, F f)
  {
    boost::asio::thread_pool pool (threads);
    std::latch l (static_cast<std::ptrdiff_t> (js.size ()));

    for (auto& j : js)
    {
      boost::asio::post (pool, [&j, &l, &f] ()
      {
        try
        {
          j.digest = f (j.path);
        }
        catch (const std::exception& e)
        {
          j.error = e.what ();
        }

        l.count_down ();
      });
    }

    l.wait ();
    pool.join ();
  }

  template <typename T>
  std::optional<hash_map> basic_hasher<T>::
  hash_native (const std::vector<fs::path>& ps) const
  {
    std::vector<hash_job> js;
    js.reserve (ps.size ());
    for (const auto& p : ps)
      js.push_back (hash_job {p, std::string (), std::string ()});

    run_hash_jobs (js,
                   thread_count (js.size ()),
                   [this] (const fs::path& p) { return run_tool (p); });

    hash_map r;
    for (const auto& j : js)
    {
      if (!j.error.empty ())
      {
        emit (sink_,
              event_kind::hash_fallback,
              event_level::trace,
              j.error,
              cache_key (j.path));
        return std::nullopt;
      }

      r[cache_key (j.path)] = j.digest;
    }

    return r;
  }

  template <typename T>
  hash_map basic_hasher<T>::
  hash_portable (const std::vector<fs::path>& ps) const
  {
    std::vector<hash_job> js;
    js.reserve (ps.size ());
    for (const auto& p : ps)
      js.push_back (hash_job {p, std::string (), std::string ()});

    run_hash_jobs (js,
                   thread_count (js.size ()),
                   [] (const fs::path& p) { return compute_file_hash (p); });

    hash_map r;
    for (const auto& j : js)
    {
      if (!j.error.empty ())
        throw std::runtime_error (j.error);

      r[cache_key (j.path)] = j.digest;
    }

    return r;
  }
}
