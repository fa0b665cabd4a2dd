#pragma once

#include <string>
#include <cstdint>
#include <utility>
#include <ostream>
#include <optional>

#include <patcher/http/http-types.hxx>

namespace patcher
{
  // HTTP response.
  //
  template <typename S, typename B = S>
  struct basic_http_response
  {
    using string_type  = S;
    using body_type    = B;
    using headers_type = basic_http_headers<string_type>;

    std::uint16_t            status {0};
    http_version             version;
    string_type              reason;  // Status reason phrase.
    headers_type             headers;
    std::optional<body_type> body;

    basic_http_response () = default;

    explicit
    basic_http_response (std::uint16_t s, string_type r = string_type ())
      : status (s), reason (std::move (r)) {}

    bool
    is_success () const noexcept
    {
      return status >= 200 && status < 300;
    }

    bool
    is_redirection () const noexcept
    {
      return status >= 300 && status < 400;
    }

    bool
    is_error () const noexcept
    {
      return status >= 400;
    }

    std::optional<string_type>
    location () const
    {
      return headers.get (string_type ("Location"));
    }

    // Parsed Content-Length, nullopt if absent or malformed.
    //
    std::optional<std::uint64_t>
    content_length () const;
  };

  template <typename S, typename B>
  inline std::ostream&
  operator<< (std::ostream& o, const basic_http_response<S, B>& r)
  {
    o << r.version << ' ' << r.status;

    if (!r.reason.empty ())
      o << ' ' << r.reason;

    return o;
  }

  using http_response = basic_http_response<std::string>;
}

#include <patcher/http/http-response.ixx>
