#pragma once

#include <string>
#include <memory>
#include <cstdint>
#include <filesystem>
#include <utility>

#include <boost/asio.hpp>

#include <patcher/http/http-client.hxx>
#include <patcher/download/download-types.hxx>

namespace patcher
{
  namespace fs   = std::filesystem;
  namespace asio = boost::asio;

  // The transport used by the synchronizer: everything it needs from the
  // patch server over HTTP(S).
  //
  class http_coordinator
  {
  public:
    using client_type   = http_client;
    using traits_type   = http_client_traits<>;
    using response_type = http_response;

    explicit
    http_coordinator (asio::io_context&);

    http_coordinator (asio::io_context&, const traits_type&);

    http_coordinator (const http_coordinator&) = delete;
    http_coordinator& operator= (const http_coordinator&) = delete;

    // GET the URL and return the final status code (after redirects). The
    // body is read and discarded. Only network failures throw.
    //
    asio::awaitable<std::uint16_t>
    status (const std::string& url);

    // GET the URL and return the body. Throws on anything but 2xx.
    //
    asio::awaitable<std::string>
    get (const std::string& url);

    // Stream the URL to the target file, creating parent directories.
    // Returns the number of bytes written.
    //
    asio::awaitable<std::uint64_t>
    download_file (const std::string& url,
                   const fs::path& target,
                   transfer_callback progress = nullptr);

  private:
    asio::io_context& ioc_;
    std::unique_ptr<client_type> client_;
  };
}
