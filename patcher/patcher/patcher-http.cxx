#include <patcher/patcher-http.hxx>

#include <sstream>
#include <stdexcept>
#include <system_error>

using namespace std;

namespace patcher
{
  static string
  fmt_err (const string& u, const http_response& r)
  {
    ostringstream o;
    o << "GET " << u << ": HTTP " << r.status;

    if (!r.reason.empty ())
      o << ' ' << r.reason;

    // Servers like to send whole HTML error pages, so only show the start.
    //
    if (r.body && !r.body->empty ())
    {
      const string& b (*r.body);
      const size_t m (200);

      if (b.size () <= m)
        o << ": " << b;
      else
        o << ": " << b.substr (0, m) << "...";
    }

    return o.str ();
  }

  http_coordinator::
  http_coordinator (asio::io_context& i)
    : ioc_ (i),
      client_ (make_unique<client_type> (i))
  {
  }

  http_coordinator::
  http_coordinator (asio::io_context& i, const traits_type& t)
    : ioc_ (i),
      client_ (make_unique<client_type> (i, t))
  {
  }

  asio::awaitable<uint16_t> http_coordinator::
  status (const string& u)
  {
    response_type r (co_await client_->get (u));
    co_return r.status;
  }

  asio::awaitable<string> http_coordinator::
  get (const string& u)
  {
    response_type r (co_await client_->get (u));

    if (!r.is_success ())
      throw runtime_error (fmt_err (u, r));

    if (!r.body)
      co_return string ();

    co_return move (*r.body);
  }

  asio::awaitable<uint64_t> http_coordinator::
  download_file (const string& u, const fs::path& t, transfer_callback cb)
  {
    if (t.has_parent_path ())
    {
      error_code e;
      fs::create_directories (t.parent_path (), e);

      if (e)
        throw runtime_error ("unable to create directory " +
                             t.parent_path ().string () + ": " +
                             e.message ());
    }

    uint64_t n (co_await client_->download (u, t, move (cb)));
    co_return n;
  }
}
