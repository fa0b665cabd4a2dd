#include <patcher/patcher-progress.hxx>

#include <chrono>
#include <ostream>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/redirect_error.hpp>

using namespace std;

namespace patcher
{
  progress_coordinator::
  progress_coordinator (asio::io_context& c, bool e, ostream& o)
    : ioc_ (c),
      enabled_ (e),
      os_ (o),
      renderer_ (make_unique<renderer_type> (o)),
      timer_ (c)
  {
  }

  void progress_coordinator::
  start (string l)
  {
    if (running_.exchange (true))
      return;

    label_ = move (l);
    tracker_.reset ();

    if (enabled_)
      asio::co_spawn (ioc_, render_loop (), asio::detached);
  }

  void progress_coordinator::
  stop ()
  {
    if (!running_.exchange (false))
      return;

    timer_.cancel ();

    if (enabled_)
    {
      draw ();
      renderer_->finish ();
    }
  }

  bool progress_coordinator::
  running () const noexcept
  {
    return running_.load (memory_order_relaxed);
  }

  void progress_coordinator::
  print (const string& s)
  {
    // Erase the line, print, and let the next tick redraw underneath.
    //
    if (enabled_ && running ())
      renderer_->clear ();

    os_ << s << endl;
  }

  void progress_coordinator::
  draw ()
  {
    tracker_.update (metrics_.current_bytes.load (memory_order_relaxed));
    metrics_.speed.store (tracker_.speed (), memory_order_relaxed);

    renderer_->render (label_, progress_snapshot (metrics_));
  }

  asio::awaitable<void> progress_coordinator::
  render_loop ()
  {
    while (running ())
    {
      // Nothing to show until the batch has been sized.
      //
      if (metrics_.state.load (memory_order_relaxed) != progress_state::idle)
        draw ();

      timer_.expires_after (chrono::milliseconds (100));

      boost::system::error_code ec;
      co_await timer_.async_wait (asio::redirect_error (asio::use_awaitable,
                                                        ec));
    }
  }
}
