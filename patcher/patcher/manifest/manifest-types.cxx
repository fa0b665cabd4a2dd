#include <patcher/manifest/manifest-types.hxx>

#include <patcher/hash/hash-types.hxx>
#include <patcher/http/http-types.hxx>

using namespace std;

namespace patcher
{
  string manifest_entry::
  key () const
  {
    if (!local_path)
      throw logic_error ("manifest entry " +
                         relative_path.generic_string () +
                         " is not resolved");

    return cache_key (*local_path);
  }

  manifest_entries
  resolve_entries (const manifest_entries& es,
                   const fs::path& root,
                   const string& url_root)
  {
    // Strip the trailing slash off the URL root since the suffix always
    // brings its own.
    //
    string u (url_root);
    while (!u.empty () && u.back () == '/')
      u.pop_back ();

    // Cache keys are absolute so that they mean the same thing whatever the
    // current directory of a later run.
    //
    fs::path a (root.is_absolute () ? root : fs::absolute (root));

    manifest_entries r;
    r.reserve (es.size ());

    for (const auto& e : es)
    {
      manifest_entry n (e);
      n.local_path = a / e.relative_path;
      n.remote_url = u + encode_url_path (e.url_suffix);
      r.push_back (move (n));
    }

    return r;
  }

  uint64_t
  total_size (const manifest_entries& es)
  {
    uint64_t n (0);
    for (const auto& e : es)
      n += e.expected_size;
    return n;
  }
}
