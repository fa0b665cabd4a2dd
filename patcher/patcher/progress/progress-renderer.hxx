#pragma once

#include <string>
#include <iostream>

#include <ftxui/dom/elements.hpp>
#include <ftxui/screen/screen.hpp>

#include <patcher/progress/progress-types.hxx>
#include <patcher/progress/progress-tracker.hxx>

namespace patcher
{
  template <typename S = std::string>
  struct progress_renderer_traits
  {
    using string_type = S;

    // Render the batch line:
    //
    // Downloading [ 3/10] ######......  45% 1.0 MiB / 2.2 MiB @ ...
    //
    static ftxui::Element
    render_line (const string_type& label, const progress_snapshot&);
  };

  // Redraws a single terminal line in place.
  //
  // Unlike a full screen UI this leaves the terminal scrollback alone so
  // the diagnostics printed before and after the batch stay readable.
  //
  template <typename T = progress_renderer_traits<>>
  class basic_progress_renderer
  {
  public:
    using traits_type = T;
    using string_type = typename traits_type::string_type;

    explicit
    basic_progress_renderer (std::ostream& os = std::cerr)
      : os_ (os)
    {
    }

    basic_progress_renderer (const basic_progress_renderer&) = delete;
    basic_progress_renderer& operator= (const basic_progress_renderer&) = delete;

    // Draw the current state over the previous one.
    //
    void
    render (const string_type& label, const progress_snapshot&);

    // Leave the last drawn line on the terminal and start a new one.
    //
    void
    finish ();

    // Erase the drawn line so that something else can be printed in its
    // place. The next render() starts afresh.
    //
    void
    clear ();

    bool
    drawn () const noexcept
    {
      return drawn_;
    }

  private:
    std::ostream& os_;
    std::string reset_;
    std::string clear_;
    bool drawn_ = false;
  };

  using progress_renderer = basic_progress_renderer<>;
}

#include <patcher/progress/progress-renderer.txx>
