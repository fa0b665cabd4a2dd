#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <utility>
#include <ostream>
#include <optional>

namespace patcher
{
  // HTTP method. We only ever read from the server.
  //
  enum class http_method
  {
    get
  };

  std::string
  to_string (http_method);

  inline std::ostream&
  operator<< (std::ostream& o, http_method m)
  {
    return o << to_string (m);
  }

  // Case-insensitive comparison of header names.
  //
  bool
  header_name_equal (const std::string&, const std::string&) noexcept;

  // HTTP header field.
  //
  template <typename S>
  struct basic_http_field
  {
    using string_type = S;

    string_type name;
    string_type value;

    basic_http_field () = default;

    basic_http_field (string_type n, string_type v)
      : name (std::move (n)), value (std::move (v)) {}
  };

  template <typename S>
  inline bool
  operator== (const basic_http_field<S>& x, const basic_http_field<S>& y)
  {
    return x.name == y.name && x.value == y.value;
  }

  // HTTP headers collection. Lookups ignore the case of the name.
  //
  template <typename S>
  struct basic_http_headers
  {
    using string_type = S;
    using field_type  = basic_http_field<string_type>;
    using fields_type = std::vector<field_type>;

    fields_type fields;

    // Set a header field, replacing any existing field with the same name.
    //
    void
    set (string_type name, string_type value);

    // Add a header field (allows duplicates).
    //
    void
    add (string_type name, string_type value);

    // Return the first value for the name or nullopt if not present.
    //
    std::optional<string_type>
    get (const string_type& name) const;

    bool
    contains (const string_type& name) const
    {
      return get (name).has_value ();
    }

    void
    remove (const string_type& name);

    bool
    empty () const noexcept
    {
      return fields.empty ();
    }

    std::size_t
    size () const noexcept
    {
      return fields.size ();
    }

    using const_iterator = typename fields_type::const_iterator;

    const_iterator begin () const noexcept { return fields.begin (); }
    const_iterator end ()   const noexcept { return fields.end (); }
  };

  using http_field   = basic_http_field<std::string>;
  using http_headers = basic_http_headers<std::string>;

  // HTTP version.
  //
  struct http_version
  {
    std::uint8_t major;
    std::uint8_t minor;

    http_version (std::uint8_t maj = 1, std::uint8_t min = 1)
      : major (maj), minor (min) {}

    // As used by Beast (11 for HTTP/1.1).
    //
    unsigned
    number () const noexcept
    {
      return major * 10u + minor;
    }

    bool
    operator== (const http_version& v) const noexcept
    {
      return major == v.major && minor == v.minor;
    }

    std::string
    string () const;
  };

  inline std::ostream&
  operator<< (std::ostream& o, const http_version& v)
  {
    return o << v.string ();
  }

  // Components of an http(s) URL.
  //
  struct url_parts
  {
    std::string scheme;
    std::string host;
    std::string port;
    std::string target; // Path, query, and fragment; at least "/".

    bool
    secure () const noexcept
    {
      return scheme == "https";
    }

    // scheme://host[:port] without a trailing slash.
    //
    std::string
    origin () const;
  };

  // Parse a scheme://host[:port][/target] URL.
  //
  // The scheme defaults to http and the port to the scheme's default. This
  // is deliberately simple: no IPv6 literals, no user info. Throws
  // std::invalid_argument for an unsupported scheme or an empty host.
  //
  url_parts
  parse_url (const std::string&);

  // Percent-encode a URL path. Unreserved characters, sub-delimiters, ':',
  // '@', and '/' are left alone as are existing %XX escapes, so encoding an
  // encoded path is a no-op. Everything else (space, non-ASCII UTF-8 bytes)
  // becomes %XX with uppercase hex digits.
  //
  std::string
  encode_url_path (const std::string&);

  // Resolve a Location header value against the URL it was returned for.
  //
  std::string
  resolve_location (const std::string& base, const std::string& location);
}

#include <patcher/http/http-types.ixx>
