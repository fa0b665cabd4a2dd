#include <patcher/hash/hash-types.hxx>

#include <memory>
#include <cctype>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <algorithm>
#include <stdexcept>

#include <openssl/evp.h>

using namespace std;

namespace patcher
{
  string
  compute_file_hash (const fs::path& p)
  {
    ifstream ifs (p, ios::binary);
    if (!ifs)
      throw runtime_error ("failed to open file for hashing: " + p.string ());

    unique_ptr<EVP_MD_CTX, decltype (&EVP_MD_CTX_free)> ctx (
      EVP_MD_CTX_new (), &EVP_MD_CTX_free);

    if (!ctx || EVP_DigestInit_ex (ctx.get (), EVP_sha256 (), nullptr) != 1)
      throw runtime_error ("failed to initialize SHA-256 context");

    char buf[8192];
    while (ifs.read (buf, sizeof (buf)) || ifs.gcount () > 0)
    {
      if (EVP_DigestUpdate (ctx.get (),
                            buf,
                            static_cast<size_t> (ifs.gcount ())) != 1)
        throw runtime_error ("failed to update SHA-256 digest: " +
                             p.string ());
    }

    if (ifs.bad ())
      throw runtime_error ("error reading file for hashing: " + p.string ());

    unsigned char md[EVP_MAX_MD_SIZE];
    unsigned int n (0);

    if (EVP_DigestFinal_ex (ctx.get (), md, &n) != 1)
      throw runtime_error ("failed to finalize SHA-256 digest: " +
                           p.string ());

    ostringstream oss;
    for (unsigned int i (0); i < n; ++i)
      oss << hex << setw (2) << setfill ('0') << static_cast<int> (md[i]);

    return oss.str ();
  }

  bool
  compare_hashes (const string& h1, const string& h2)
  {
    if (h1.size () != h2.size ())
      return false;

    return equal (h1.begin (),
                  h1.end (),
                  h2.begin (),
                  [] (char a, char b)
    {
      return tolower (static_cast<unsigned char> (a)) ==
             tolower (static_cast<unsigned char> (b));
    });
  }

  bool
  valid_hash (const string& h)
  {
    return h.size () == hash_hex_size &&
           all_of (h.begin (), h.end (),
                   [] (unsigned char c) { return isxdigit (c) != 0; });
  }

  string
  cache_key (const fs::path& p)
  {
    return p.lexically_normal ().string ();
  }
}
