#include <patcher/manifest/manifest-parser.hxx>

#include <charconv>
#include <algorithm>

using namespace std;

namespace patcher
{
  static string
  trim (const string& s)
  {
    const char* ws (" \t\r");

    size_t b (s.find_first_not_of (ws));
    if (b == string::npos)
      return string ();

    size_t e (s.find_last_not_of (ws));
    return s.substr (b, e - b + 1);
  }

  static string
  where (size_t n)
  {
    return n != 0 ? " on line " + std::to_string (n) : string ();
  }

  optional<manifest_entry>
  parse_manifest_line (const string& line, size_t n)
  {
    string l (line);
    replace (l.begin (), l.end (), '\\', '/');

    // Split on every comma. Anything but exactly three fields is noise we
    // don't understand (blank lines, trailing garbage) and is ignored.
    //
    vector<string> fd;
    for (size_t b (0);;)
    {
      size_t p (l.find (',', b));
      fd.push_back (l.substr (b, p == string::npos ? string::npos : p - b));

      if (p == string::npos)
        break;

      b = p + 1;
    }

    if (fd.size () != 3)
      return nullopt;

    string t (trim (fd[0]));
    string h (trim (fd[1]));
    string s (trim (fd[2]));

    uint64_t sz (0);
    {
      auto r (from_chars (s.data (), s.data () + s.size (), sz));

      if (s.empty () || r.ec != errc () || r.ptr != s.data () + s.size ())
        throw manifest_error ("invalid file size '" + s + "'" + where (n));
    }

    size_t b (t.find_first_not_of ('/'));
    if (b == string::npos)
      throw manifest_error ("empty file path" + where (n));

    fs::path p (t.substr (b));

    // Refuse anything that would land outside of the output root.
    //
    for (const auto& c : p)
    {
      if (c == "..")
        throw manifest_error ("file path '" + t + "' escapes the output "
                              "directory" + where (n));
    }

    // The URL suffix is the token as listed. Make sure it is joinable to the
    // URL root even if the listing omitted the leading separator.
    //
    string u (b == 0 ? '/' + t : t);

    return manifest_entry (move (p), move (u), move (h), sz);
  }

  manifest_entries
  parse_manifest (const string& text)
  {
    manifest_entries r;

    size_t n (0);
    for (size_t b (0); b <= text.size ();)
    {
      size_t e (text.find ('\n', b));
      if (e == string::npos)
        e = text.size ();

      ++n;
      if (auto en = parse_manifest_line (text.substr (b, e - b), n))
        r.push_back (move (*en));

      b = e + 1;
    }

    if (r.empty ())
      throw manifest_error ("file list contains no entries");

    return r;
  }
}
