#include <charconv>

namespace patcher
{
  template <typename S, typename B>
  inline std::optional<std::uint64_t> basic_http_response<S, B>::
  content_length () const
  {
    auto v (headers.get (string_type ("Content-Length")));

    if (!v || v->empty ())
      return std::nullopt;

    std::uint64_t n (0);
    auto r (std::from_chars (v->data (), v->data () + v->size (), n));

    if (r.ec == std::errc () && r.ptr == v->data () + v->size ())
      return n;

    return std::nullopt;
  }
}
