#include <algorithm>

namespace patcher
{
  template <typename S>
  inline void basic_http_headers<S>::
  set (string_type name, string_type value)
  {
    remove (name);
    fields.emplace_back (std::move (name), std::move (value));
  }

  template <typename S>
  inline void basic_http_headers<S>::
  add (string_type name, string_type value)
  {
    fields.emplace_back (std::move (name), std::move (value));
  }

  template <typename S>
  inline std::optional<typename basic_http_headers<S>::string_type>
  basic_http_headers<S>::
  get (const string_type& name) const
  {
    for (const auto& f: fields)
    {
      if (header_name_equal (f.name, name))
        return f.value;
    }

    return std::nullopt;
  }

  template <typename S>
  inline void basic_http_headers<S>::
  remove (const string_type& name)
  {
    fields.erase (std::remove_if (fields.begin (),
                                  fields.end (),
                                  [&name] (const field_type& f)
    {
      return header_name_equal (f.name, name);
    }), fields.end ());
  }
}
