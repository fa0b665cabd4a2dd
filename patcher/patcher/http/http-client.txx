#include <limits>
#include <fstream>
#include <optional>
#include <stdexcept>

#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <openssl/err.h>
#include <openssl/ssl.h>

namespace patcher
{
  namespace http = beast::http;
  using tcp = asio::ip::tcp;

  inline http::verb
  to_beast_verb (http_method m)
  {
    switch (m)
    {
      case http_method::get: return http::verb::get;
    }
    return http::verb::get;
  }

  template <typename T>
  inline typename basic_http_client<T>::string_type basic_http_client<T>::
  to_string_type (beast::string_view v)
  {
    return string_type (v.data (), v.size ());
  }

  template <typename T>
  asio::awaitable<void> basic_http_client<T>::
  connect (tcp_stream_type& s, const url_parts& u)
  {
    tcp::resolver rslv (session_->io_context ());
    auto addrs (co_await rslv.async_resolve (u.host,
                                             u.port,
                                             asio::use_awaitable));

    expire (s, session_->traits ().connect_timeout);
    co_await s.async_connect (addrs, asio::use_awaitable);
  }

  template <typename T>
  asio::awaitable<void> basic_http_client<T>::
  connect (ssl_stream_type& s, const url_parts& u)
  {
    // Beast doesn't wrap SNI so we have to go down to the OpenSSL handle.
    // Without it many CDNs will hand us the wrong certificate or refuse the
    // handshake outright.
    //
    if (!SSL_set_tlsext_host_name (s.native_handle (), u.host.c_str ()))
    {
      beast::error_code ec (static_cast<int> (::ERR_get_error ()),
                            asio::error::get_ssl_category ());
      throw beast::system_error (ec, "unable to set SNI hostname");
    }

    if (session_->traits ().verify_ssl)
      s.set_verify_callback (ssl::host_name_verification (u.host));

    co_await connect (beast::get_lowest_layer (s), u);
    co_await s.async_handshake (ssl::stream_base::client,
                                asio::use_awaitable);
  }

  template <typename T>
  asio::awaitable<typename basic_http_client<T>::response_type>
  basic_http_client<T>::
  request_impl (request_type req, std::uint8_t redirect_count)
  {
    const auto& tr (session_->traits ());
    url_parts u (parse_url (req.url));

    auto exchange = [&] (auto& s) -> asio::awaitable<response_type>
    {
      auto& layer (beast::get_lowest_layer (s));

      http::request<http::empty_body> br (to_beast_verb (req.method),
                                          u.target,
                                          req.version.number ());

      for (const auto& h: req.headers)
        br.set (h.name, h.value);

      expire (layer, tr.request_timeout);
      co_await http::async_write (s, br, asio::use_awaitable);

      beast::flat_buffer b;
      http::response_parser<http::string_body> p;
      p.body_limit (tr.body_limit);

      co_await http::async_read (s, b, p, asio::use_awaitable);

      auto m (p.release ());

      response_type r;
      r.status  = static_cast<std::uint16_t> (m.result_int ());
      r.version = http_version (static_cast<std::uint8_t> (m.version () / 10),
                                static_cast<std::uint8_t> (m.version () % 10));
      r.reason  = to_string_type (m.reason ());

      for (const auto& f: m)
        r.headers.add (to_string_type (f.name_string ()),
                       to_string_type (f.value ()));

      if (!m.body ().empty ())
        r.body = std::move (m.body ());

      co_return r;
    };

    auto& ioc (session_->io_context ());
    response_type r;

    // Note that we don't bother with a TLS shutdown: plenty of servers just
    // drop the connection after the response and waiting for close_notify
    // can block until the timeout. Closing the socket is enough.
    //
    if (u.secure ())
    {
      ssl_stream_type s (ioc, session_->ssl_context ());
      co_await connect (s, u);
      r = co_await exchange (s);

      beast::error_code ec;
      beast::get_lowest_layer (s).socket ().shutdown (
        tcp::socket::shutdown_both, ec);
    }
    else
    {
      tcp_stream_type s (ioc);
      co_await connect (s, u);
      r = co_await exchange (s);

      beast::error_code ec;
      s.socket ().shutdown (tcp::socket::shutdown_both, ec);
    }

    if (tr.follow_redirects && r.is_redirection () && r.status != 304)
    {
      if (auto l = r.location ())
      {
        if (redirect_count >= tr.max_redirects)
          throw std::runtime_error ("maximum redirects exceeded for " +
                                    req.url);

        // Carry the headers over except for Host which must now name the
        // new location.
        //
        request_type n (req.method, resolve_location (req.url, *l));
        n.headers = req.headers;
        n.headers.remove (string_type ("Host"));
        n.normalize (tr.user_agent);

        co_return co_await request_impl (std::move (n), redirect_count + 1);
      }
    }

    co_return r;
  }

  template <typename T>
  asio::awaitable<std::uint64_t> basic_http_client<T>::
  download_impl (const string_type& url,
                 const fs::path& file,
                 progress_callback progress,
                 std::uint8_t redirect_count)
  {
    const auto& tr (session_->traits ());
    url_parts u (parse_url (url));

    request_type req (http_method::get, url);
    req.normalize (tr.user_agent);

    std::optional<string_type> loc;
    std::uint64_t n (0);

    auto transfer = [&] (auto& s) -> asio::awaitable<void>
    {
      auto& layer (beast::get_lowest_layer (s));

      http::request<http::empty_body> br (http::verb::get,
                                          u.target,
                                          req.version.number ());

      for (const auto& h: req.headers)
        br.set (h.name, h.value);

      expire (layer, tr.request_timeout);
      co_await http::async_write (s, br, asio::use_awaitable);

      beast::flat_buffer b;
      http::response_parser<http::buffer_body> p;
      p.body_limit (std::numeric_limits<std::uint64_t>::max ());

      co_await http::async_read_header (s, b, p, asio::use_awaitable);

      unsigned st (p.get ().result_int ());

      if (tr.follow_redirects && st >= 300 && st < 400 && st != 304)
      {
        auto l (p.get ()[http::field::location]);
        if (!l.empty ())
        {
          loc = to_string_type (l);
          co_return;
        }
      }

      if (st != 200)
        throw std::runtime_error ("download of " + url +
                                  " failed with status: " +
                                  std::to_string (st));

      std::uint64_t tot (p.content_length () ? *p.content_length () : 0);

      std::ofstream ofs (file, std::ios::binary | std::ios::trunc);
      if (!ofs)
        throw std::runtime_error ("unable to open " + file.string () +
                                  " for writing");

      char buf[8192];

      while (!p.is_done ())
      {
        p.get ().body ().data = buf;
        p.get ().body ().size = sizeof (buf);

        // Re-arm for every chunk: a large file legitimately takes longer
        // than the request timeout as long as data keeps flowing.
        //
        expire (layer, tr.request_timeout);

        beast::error_code ec;
        co_await http::async_read (s,
                                   b,
                                   p,
                                   asio::redirect_error (asio::use_awaitable,
                                                         ec));

        // The parser stops with need_buffer whenever our chunk is full.
        //
        if (ec == http::error::need_buffer)
          ec = {};

        if (ec)
          throw beast::system_error (ec);

        std::size_t k (sizeof (buf) - p.get ().body ().size);
        if (k != 0)
        {
          ofs.write (buf, static_cast<std::streamsize> (k));
          if (!ofs)
            throw std::runtime_error ("unable to write " + file.string ());

          n += k;

          if (progress)
            progress (n, tot);
        }
      }

      ofs.close ();
      if (!ofs)
        throw std::runtime_error ("unable to write " + file.string ());
    };

    auto& ioc (session_->io_context ());

    if (u.secure ())
    {
      ssl_stream_type s (ioc, session_->ssl_context ());
      co_await connect (s, u);
      co_await transfer (s);

      beast::error_code ec;
      beast::get_lowest_layer (s).socket ().shutdown (
        tcp::socket::shutdown_both, ec);
    }
    else
    {
      tcp_stream_type s (ioc);
      co_await connect (s, u);
      co_await transfer (s);

      beast::error_code ec;
      s.socket ().shutdown (tcp::socket::shutdown_both, ec);
    }

    if (loc)
    {
      if (redirect_count >= tr.max_redirects)
        throw std::runtime_error ("maximum redirects exceeded for " + url);

      co_return co_await download_impl (resolve_location (url, *loc),
                                        file,
                                        std::move (progress),
                                        redirect_count + 1);
    }

    co_return n;
  }
}
