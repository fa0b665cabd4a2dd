#pragma once

#include <string>
#include <memory>
#include <cstdint>
#include <functional>
#include <filesystem>

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>

#include <patcher/http/http-types.hxx>
#include <patcher/http/http-request.hxx>
#include <patcher/http/http-response.hxx>

#include <patcher/version.hxx>

namespace patcher
{
  namespace fs    = std::filesystem;
  namespace asio  = boost::asio;
  namespace beast = boost::beast;
  namespace ssl   = boost::asio::ssl;

  // HTTP client options.
  //
  template <typename S = std::string>
  struct http_client_traits
  {
    using string_type   = S;
    using request_type  = basic_http_request<string_type>;
    using response_type = basic_http_response<string_type>;

    // Connection timeout in milliseconds (0 = no timeout).
    //
    std::uint32_t connect_timeout = 30000;

    // Timeout for sending the request and for each read of the response in
    // milliseconds (0 = no timeout).
    //
    std::uint32_t request_timeout = 60000;

    // Maximum number of redirects to follow.
    //
    std::uint8_t max_redirects = 10;

    // Whether to verify the peer certificate and host name.
    //
    bool verify_ssl = true;

    // CA bundle (empty = use system defaults).
    //
    string_type ssl_cert_file;

    string_type user_agent = string_type ("patcher/" PATCHER_VERSION_STR);

    bool follow_redirects = true;

    // Largest response body kept in memory. Downloads are streamed to disk
    // and are not subject to this limit.
    //
    std::uint64_t body_limit = 64 * 1024 * 1024;
  };

  // Per-client state shared by all requests: the I/O context, options, and
  // the TLS context.
  //
  template <typename T = http_client_traits<>>
  class basic_http_session
  {
  public:
    using traits_type = T;

    basic_http_session (asio::io_context& ioc, const traits_type& traits)
      : ioc_ (ioc), traits_ (traits), ssl_ctx_ (ssl::context::tls_client)
    {
      configure_ssl ();
    }

    basic_http_session (const basic_http_session&) = delete;
    basic_http_session& operator= (const basic_http_session&) = delete;

    asio::io_context&
    io_context () noexcept
    {
      return ioc_;
    }

    const traits_type&
    traits () const noexcept
    {
      return traits_;
    }

    ssl::context&
    ssl_context () noexcept
    {
      return ssl_ctx_;
    }

  private:
    void
    configure_ssl ();

  private:
    asio::io_context& ioc_;
    traits_type traits_;
    ssl::context ssl_ctx_;
  };

  // Coroutine-based HTTP/1.1 client over Boost.Beast.
  //
  // Every request uses its own connection.
  //
  template <typename T = http_client_traits<>>
  class basic_http_client
  {
  public:
    using traits_type   = T;
    using string_type   = typename traits_type::string_type;
    using request_type  = typename traits_type::request_type;
    using response_type = typename traits_type::response_type;
    using session_type  = basic_http_session<traits_type>;

    // Download progress: (bytes_transferred, total_bytes). The total is 0
    // if the server did not say.
    //
    using progress_callback =
      std::function<void (std::uint64_t, std::uint64_t)>;

    explicit
    basic_http_client (asio::io_context& ioc,
                       const traits_type& traits = traits_type ())
      : session_ (std::make_unique<session_type> (ioc, traits)) {}

    basic_http_client (const basic_http_client&) = delete;
    basic_http_client& operator= (const basic_http_client&) = delete;

    // Perform a request, following redirects, and return the final response
    // whatever its status.
    //
    asio::awaitable<response_type>
    request (const request_type&);

    asio::awaitable<response_type>
    get (const string_type& url);

    // Stream the body of a GET to a file, truncating it. The file is only
    // opened once the server has answered with 200.
    //
    // Return the number of bytes written. Throw on network errors and on
    // any other final status.
    //
    asio::awaitable<std::uint64_t>
    download (const string_type& url,
              const fs::path& file,
              progress_callback progress = nullptr);

    session_type&
    session () noexcept
    {
      return *session_;
    }

  private:
    using tcp_stream_type = beast::tcp_stream;
    using ssl_stream_type = beast::ssl_stream<beast::tcp_stream>;

    asio::awaitable<response_type>
    request_impl (request_type, std::uint8_t redirect_count);

    asio::awaitable<std::uint64_t>
    download_impl (const string_type& url,
                   const fs::path& file,
                   progress_callback progress,
                   std::uint8_t redirect_count);

    asio::awaitable<void>
    connect (tcp_stream_type&, const url_parts&);

    asio::awaitable<void>
    connect (ssl_stream_type&, const url_parts&);

    // Arm (or disarm, for 0) the stream timer.
    //
    static void
    expire (tcp_stream_type&, std::uint32_t ms);

    static string_type
    to_string_type (beast::string_view);

  private:
    std::unique_ptr<session_type> session_;
  };

  using http_session = basic_http_session<>;
  using http_client  = basic_http_client<>;
}

#include <patcher/http/http-client.ixx>
#include <patcher/http/http-client.txx>
