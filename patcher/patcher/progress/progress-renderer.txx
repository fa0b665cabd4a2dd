#include <sstream>
#include <iomanip>

namespace patcher
{
  template <typename S>
  ftxui::Element progress_renderer_traits<S>::
  render_line (const string_type& label, const progress_snapshot& s)
  {
    using namespace ftxui;
    using fmt = basic_progress_formatter<progress_tracker_traits<S>>;

    std::ostringstream c;
    c << " [" << std::setw (2) << s.completed_items + s.failed_items
      << '/' << std::setw (2) << s.total_items << "] ";

    Element g (s.total_bytes == 0
               ? text ("...")
               : gauge (s.progress_ratio ()));

    Element line (hbox ({
      text (label) | bold,
      text (c.str ()),
      std::move (g) | flex,
      text (' ' + fmt ().format_stats (s))
    }));

    if (s.state == progress_state::failed)
      line = std::move (line) | color (Color::Red);
    else if (s.state == progress_state::completed)
      line = std::move (line) | color (Color::Green);

    return line;
  }

  template <typename T>
  void basic_progress_renderer<T>::
  render (const string_type& label, const progress_snapshot& s)
  {
    using namespace ftxui;

    Element e (traits_type::render_line (label, s));

    auto screen (Screen::Create (Dimension::Full (), Dimension::Fit (e)));
    Render (screen, e);

    os_ << reset_ << screen.ToString () << std::flush;
    reset_ = screen.ResetPosition ();
    clear_ = screen.ResetPosition (true);
    drawn_ = true;
  }

  template <typename T>
  void basic_progress_renderer<T>::
  finish ()
  {
    if (drawn_)
      os_ << std::endl;

    reset_.clear ();
    clear_.clear ();
    drawn_ = false;
  }

  template <typename T>
  void basic_progress_renderer<T>::
  clear ()
  {
    if (drawn_)
      os_ << clear_ << std::flush;

    reset_.clear ();
    clear_.clear ();
    drawn_ = false;
  }
}
