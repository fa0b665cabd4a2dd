#include <patcher/http/http-types.hxx>

#include <cctype>
#include <cstring>
#include <algorithm>
#include <stdexcept>

using namespace std;

namespace patcher
{
  string
  to_string (http_method m)
  {
    switch (m)
    {
      case http_method::get: return "GET";
    }
    return "GET";
  }

  bool
  header_name_equal (const string& x, const string& y) noexcept
  {
    return x.size () == y.size () &&
           equal (x.begin (), x.end (), y.begin (),
                  [] (unsigned char a, unsigned char b)
    {
      return tolower (a) == tolower (b);
    });
  }

  string http_version::
  string () const
  {
    return "HTTP/" + std::to_string (major) + '.' + std::to_string (minor);
  }

  string
  encode_url_path (const string& p)
  {
    static const char hex[] = "0123456789ABCDEF";

    auto is_hex = [] (char c)
    {
      return isxdigit (static_cast<unsigned char> (c)) != 0;
    };

    string r;
    r.reserve (p.size ());

    for (size_t i (0); i != p.size (); ++i)
    {
      unsigned char c (static_cast<unsigned char> (p[i]));

      if (isalnum (c) ||
          (c != '\0' && strchr ("-._~!$&'()*+,;=:@/", c) != nullptr))
      {
        r += static_cast<char> (c);
      }
      else if (c == '%' && i + 2 < p.size () &&
               is_hex (p[i + 1]) && is_hex (p[i + 2]))
      {
        r += '%';
      }
      else
      {
        r += '%';
        r += hex[c >> 4];
        r += hex[c & 0x0F];
      }
    }

    return r;
  }

  string url_parts::
  origin () const
  {
    bool def ((scheme == "https" && port == "443") ||
              (scheme == "http"  && port == "80"));

    return scheme + "://" + host + (def ? std::string () : ':' + port);
  }

  url_parts
  parse_url (const string& url)
  {
    url_parts r;
    size_t pos (0);

    size_t p (url.find ("://"));
    if (p != string::npos)
    {
      r.scheme = url.substr (0, p);
      transform (r.scheme.begin (), r.scheme.end (), r.scheme.begin (),
                 [] (unsigned char c) { return tolower (c); });
      pos = p + 3;
    }
    else
      r.scheme = "http";

    if (r.scheme != "http" && r.scheme != "https")
      throw invalid_argument ("unsupported URL scheme '" + r.scheme +
                              "' in " + url);

    // The authority ends at the start of the path, query, or fragment.
    //
    size_t end (url.find_first_of ("/?#", pos));
    if (end == string::npos)
      end = url.size ();

    std::string auth (url.substr (pos, end - pos));
    size_t colon (auth.find (':'));

    if (colon != string::npos)
    {
      r.host = auth.substr (0, colon);
      r.port = auth.substr (colon + 1);
    }
    else
      r.host = auth;

    if (r.port.empty ())
      r.port = r.secure () ? "443" : "80";

    if (r.host.empty ())
      throw invalid_argument ("no host in URL " + url);

    if (end < url.size ())
    {
      r.target = url.substr (end);
      if (r.target[0] != '/')
        r.target.insert (0, 1, '/');
    }
    else
      r.target = "/";

    return r;
  }

  string
  resolve_location (const string& base, const string& loc)
  {
    if (loc.find ("://") != string::npos)
      return loc;

    url_parts b (parse_url (base));

    // Scheme-relative.
    //
    if (loc.compare (0, 2, "//") == 0)
      return b.scheme + ':' + loc;

    if (!loc.empty () && loc[0] == '/')
      return b.origin () + loc;

    // Relative to the directory of the current target.
    //
    std::string t (b.target.substr (0, b.target.find_first_of ("?#")));
    return b.origin () + t.substr (0, t.rfind ('/') + 1) + loc;
  }
}
