#pragma once

#include <string>
#include <utility>

#include <patcher/http/http-types.hxx>

namespace patcher
{
  // HTTP request. Bodies are never sent.
  //
  template <typename S>
  struct basic_http_request
  {
    using string_type  = S;
    using headers_type = basic_http_headers<string_type>;

    http_method  method {http_method::get};
    string_type  url;
    http_version version;
    headers_type headers;

    basic_http_request () = default;

    basic_http_request (http_method m, string_type u)
      : method (m), url (std::move (u)) {}

    void
    set_header (string_type name, string_type value)
    {
      headers.set (std::move (name), std::move (value));
    }

    bool
    has_header (const string_type& name) const
    {
      return headers.contains (name);
    }

    bool
    valid () const noexcept
    {
      return !url.empty ();
    }

    // Add the Host and User-Agent headers unless already present.
    //
    void
    normalize (const string_type& user_agent);
  };

  template <typename S>
  inline void basic_http_request<S>::
  normalize (const string_type& ua)
  {
    if (!has_header (string_type ("Host")))
    {
      url_parts p (parse_url (url));
      set_header (string_type ("Host"), p.host);
    }

    if (!has_header (string_type ("User-Agent")) && !ua.empty ())
      set_header (string_type ("User-Agent"), ua);
  }

  template <typename S>
  inline std::ostream&
  operator<< (std::ostream& o, const basic_http_request<S>& r)
  {
    return o << r.method << ' ' << r.url << ' ' << r.version;
  }

  using http_request = basic_http_request<std::string>;
}
