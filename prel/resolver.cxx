// file      : prel/resolver.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <prel/resolver.hxx>

#include <regex>
#include <limits> // numeric_limits

using namespace std;
using namespace butl;

namespace prel
{
  // Parse a decimal number. Fail if the string is empty, contains anything
  // other than digits, has a leading zero (unless zero itself), or
  // overflows.
  //
  static optional<uint64_t>
  parse_number (const string& s)
  {
    if (s.empty () || (s[0] == '0' && s.size () != 1))
      return nullopt;

    uint64_t r (0);
    for (char c: s)
    {
      if (c < '0' || c > '9')
        return nullopt;

      uint64_t d (c - '0');

      if (r > (numeric_limits<uint64_t>::max () - d) / 10)
        return nullopt;

      r = r * 10 + d;
    }

    return r;
  }

  static strings
  split (const string& s, char d)
  {
    strings r;

    for (size_t b (0);;)
    {
      size_t e (s.find (d, b));
      r.push_back (string (s, b, e == string::npos ? e : e - b));

      if (e == string::npos)
        break;

      b = e + 1;
    }

    return r;
  }

  static bool
  numeric (const string& s)
  {
    return !s.empty () &&
      find_if (s.begin (), s.end (),
               [] (char c) {return c < '0' || c > '9';}) == s.end ();
  }

  // Increment the release component at the specified index (0 for major, 1
  // for minor, etc) resetting the following ones to zero. If this is a
  // pre-release and all the following components are already zero, then
  // the release being prepared is already the one we want and the
  // components stay as is (the caller drops the pre-release part).
  //
  static void
  increment (vector<uint64_t>& r, size_t i, bool pre)
  {
    if (r.size () <= i)
      r.resize (i + 1, 0);

    bool zero (true);
    for (size_t j (i + 1); j != r.size (); ++j)
    {
      if (r[j] != 0)
        zero = false;

      r[j] = 0;
    }

    if (!pre || !zero)
      ++r[i];
  }

  static size_t
  component (bump_kind k)
  {
    switch (k)
    {
    case bump_kind::major: return 0;
    case bump_kind::minor: return 1;
    default:               return 2;
    }
  }

  // semver
  //
  struct semver
  {
    vector<uint64_t> release; // Major, minor, patch.
    strings pre;              // Pre-release identifiers.
    string build;             // Build metadata, ignored by ordering.
  };

  static semver
  parse_semver (const string& s)
  {
    auto bad = [&s] (const string& d)
    {
      return version_format_error (
        "invalid semver version '" + s + "': " + d);
    };

    auto valid_id = [] (const string& i)
    {
      return !i.empty () &&
        find_if (i.begin (), i.end (),
                 [] (char c)
                 {
                   return !((c >= '0' && c <= '9') ||
                            (c >= 'a' && c <= 'z') ||
                            (c >= 'A' && c <= 'Z') ||
                            c == '-');
                 }) == i.end ();
    };

    semver r;

    size_t b (s.find ('+'));
    string v (s, 0, b);

    if (b != string::npos)
    {
      r.build = string (s, b + 1);

      for (const string& i: split (r.build, '.'))
      {
        if (!valid_id (i))
          throw bad ("invalid build metadata identifier '" + i + "'");
      }
    }

    size_t p (v.find ('-'));

    if (p != string::npos)
    {
      r.pre = split (string (v, p + 1), '.');

      for (const string& i: r.pre)
      {
        if (!valid_id (i))
          throw bad ("invalid pre-release identifier '" + i + "'");

        if (numeric (i) && !parse_number (i))
          throw bad ("invalid numeric pre-release identifier '" + i + "'");
      }

      v.resize (p);
    }

    strings cs (split (v, '.'));

    if (cs.size () != 3)
      throw bad ("major, minor, and patch components expected");

    for (const string& c: cs)
    {
      optional<uint64_t> n (parse_number (c));

      if (!n)
        throw bad ("invalid version component '" + c + "'");

      r.release.push_back (*n);
    }

    return r;
  }

  static string
  print (const semver& v)
  {
    string r;

    for (uint64_t c: v.release)
    {
      if (!r.empty ())
        r += '.';

      r += to_string (c);
    }

    for (size_t i (0); i != v.pre.size (); ++i)
    {
      r += i == 0 ? '-' : '.';
      r += v.pre[i];
    }

    if (!v.build.empty ())
    {
      r += '+';
      r += v.build;
    }

    return r;
  }

  // Semantic Versioning 2.0.0 precedence (section 11).
  //
  static int
  compare (const semver& x, const semver& y)
  {
    for (size_t i (0); i != 3; ++i)
    {
      if (x.release[i] != y.release[i])
        return x.release[i] < y.release[i] ? -1 : 1;
    }

    // A version without a pre-release has higher precedence.
    //
    if (x.pre.empty () || y.pre.empty ())
      return x.pre.empty () == y.pre.empty () ? 0 : x.pre.empty () ? 1 : -1;

    for (size_t i (0); i != x.pre.size () && i != y.pre.size (); ++i)
    {
      const string& a (x.pre[i]);
      const string& b (y.pre[i]);

      bool an (numeric (a));
      bool bn (numeric (b));

      if (an && bn)
      {
        uint64_t na (*parse_number (a));
        uint64_t nb (*parse_number (b));

        if (na != nb)
          return na < nb ? -1 : 1;
      }
      else if (an != bn)
        return an ? -1 : 1; // Numeric identifiers have lower precedence.
      else if (int r = a.compare (b))
        return r < 0 ? -1 : 1;
    }

    return x.pre.size () == y.pre.size ()
      ? 0
      : x.pre.size () < y.pre.size () ? -1 : 1;
  }

  static string
  resolve_semver (const string& b, bump_kind k)
  {
    semver v (parse_semver (b));
    bool pre (!v.pre.empty ());

    v.build.clear ();

    switch (k)
    {
    case bump_kind::major:
    case bump_kind::minor:
    case bump_kind::patch:
      {
        increment (v.release, component (k), pre);
        v.pre.clear ();
        break;
      }
    case bump_kind::prerelease:
      {
        if (!pre)
        {
          increment (v.release, 2, false);
          v.pre = strings ({"rc", "1"});
          break;
        }

        // Increment the last numeric identifier or append one.
        //
        auto i (find_if (v.pre.rbegin (), v.pre.rend (), numeric));

        if (i != v.pre.rend ())
          *i = to_string (*parse_number (*i) + 1);
        else
          v.pre.push_back ("1");

        break;
      }
    case bump_kind::release:
      {
        if (!pre)
          throw version_error ("semver version " + b + " is not a "
                               "pre-release");

        v.pre.clear ();
        break;
      }
    case bump_kind::post:
      {
        throw version_scheme_error ("post-release bump is not supported by "
                                    "the semver scheme");
      }
    }

    return print (v);
  }

  // pep440
  //
  struct pep440
  {
    uint64_t epoch = 0;
    vector<uint64_t> release;

    string pre_phase;        // a, b, rc, or empty if not a pre-release.
    uint64_t pre_number = 0;

    optional<uint64_t> post;
    optional<uint64_t> dev;
  };

  static pep440
  parse_pep440 (const string& s)
  {
    // The canonical public version:
    //
    // [N!]N(.N)*[{a|b|rc}N][.postN][.devN]
    //
    static const regex re (
      "(?:([1-9][0-9]*)!)?"
      "((?:0|[1-9][0-9]*)(?:\\.(?:0|[1-9][0-9]*))*)"
      "(?:(a|b|rc)(0|[1-9][0-9]*))?"
      "(?:\\.post(0|[1-9][0-9]*))?"
      "(?:\\.dev(0|[1-9][0-9]*))?");

    smatch m;
    if (!regex_match (s, m, re))
      throw version_format_error (
        "invalid pep440 version '" + s + "': not a canonical public version");

    auto number = [&s] (const string& n)
    {
      if (optional<uint64_t> r = parse_number (n))
        return *r;

      throw version_format_error (
        "invalid pep440 version '" + s + "': component '" + n + "' is out "
        "of range");
    };

    pep440 r;

    if (m[1].matched)
      r.epoch = number (m[1].str ());

    for (const string& c: split (m[2].str (), '.'))
      r.release.push_back (number (c));

    if (m[3].matched)
    {
      r.pre_phase = m[3].str ();
      r.pre_number = number (m[4].str ());
    }

    if (m[5].matched)
      r.post = number (m[5].str ());

    if (m[6].matched)
      r.dev = number (m[6].str ());

    return r;
  }

  static string
  print (const pep440& v)
  {
    string r;

    if (v.epoch != 0)
      r = to_string (v.epoch) + '!';

    for (size_t i (0); i != v.release.size (); ++i)
    {
      if (i != 0)
        r += '.';

      r += to_string (v.release[i]);
    }

    if (!v.pre_phase.empty ())
      r += v.pre_phase + to_string (v.pre_number);

    if (v.post)
      r += ".post" + to_string (*v.post);

    if (v.dev)
      r += ".dev" + to_string (*v.dev);

    return r;
  }

  // PEP 440 ordering (see the "Summary of permitted suffixes and relative
  // ordering" section). Trailing zero release components are insignificant.
  //
  static int
  compare (const pep440& x, const pep440& y)
  {
    auto cmp = [] (uint64_t a, uint64_t b)
    {
      return a < b ? -1 : a > b ? 1 : 0;
    };

    if (int r = cmp (x.epoch, y.epoch))
      return r;

    for (size_t i (0), n (max (x.release.size (), y.release.size ()));
         i != n;
         ++i)
    {
      if (int r = cmp (i < x.release.size () ? x.release[i] : 0,
                       i < y.release.size () ? y.release[i] : 0))
        return r;
    }

    // Pre-release rank: a developmental release of the final version sorts
    // before any pre-release, the final (or post) release after any.
    //
    auto rank = [] (const pep440& v) -> int
    {
      if (v.pre_phase.empty ())
        return !v.post && v.dev ? -1 : 3;

      return v.pre_phase == "a" ? 0 : v.pre_phase == "b" ? 1 : 2;
    };

    if (int r = cmp (rank (x) + 1, rank (y) + 1))
      return r;

    if (int r = cmp (x.pre_number, y.pre_number))
      return r;

    // Absent post-release sorts before any, absent dev release after any.
    //
    if (x.post != y.post)
      return !x.post ? -1 : !y.post ? 1 : cmp (*x.post, *y.post);

    if (x.dev != y.dev)
      return !x.dev ? 1 : !y.dev ? -1 : cmp (*x.dev, *y.dev);

    return 0;
  }

  static string
  resolve_pep440 (const string& b, bump_kind k)
  {
    pep440 v (parse_pep440 (b));
    bool pre (!v.pre_phase.empty () || v.dev);

    switch (k)
    {
    case bump_kind::major:
    case bump_kind::minor:
    case bump_kind::patch:
      {
        increment (v.release, component (k), pre && !v.post);
        v.pre_phase.clear ();
        v.pre_number = 0;
        v.post = nullopt;
        v.dev = nullopt;
        break;
      }
    case bump_kind::prerelease:
      {
        if (v.pre_phase.empty ())
        {
          increment (v.release, 2, false);
          v.pre_phase = "rc";
          v.pre_number = 1;
        }
        else
          ++v.pre_number;

        v.post = nullopt;
        v.dev = nullopt;
        break;
      }
    case bump_kind::release:
      {
        if (!pre)
          throw version_error ("pep440 version " + b + " is not a "
                               "pre-release");

        v.pre_phase.clear ();
        v.pre_number = 0;
        v.post = nullopt;
        v.dev = nullopt;
        break;
      }
    case bump_kind::post:
      {
        v.post = v.post ? *v.post + 1 : 1;
        v.dev = nullopt;
        break;
      }
    }

    return print (v);
  }

  // standard
  //
  static standard_version
  parse_standard (const string& s)
  {
    try
    {
      return standard_version (s);
    }
    catch (const invalid_argument& e)
    {
      throw version_format_error (
        "invalid standard version '" + s + "': " + e.what ());
    }
  }

  // Follow the build2 release conventions: a snapshot or pre-release is
  // released as the final version unless asked for the next alpha or beta,
  // and the major/minor jumps are only possible from a final version or a
  // snapshot.
  //
  static string
  resolve_standard (const string& b, bump_kind k)
  {
    standard_version cv (parse_standard (b));

    uint64_t mj (cv.major ());
    uint64_t mi (cv.minor ());
    uint64_t pa (cv.patch ());
    uint16_t pr (cv.pre_release () ? *cv.pre_release () : 0);

    bool fin (!cv.pre_release ()); // Final (or final with revision).

    auto unsupported = [&b, k] (const char* what)
    {
      return version_scheme_error (
        to_string (k) + " bump is not supported for standard " + what +
        " version " + b);
    };

    switch (k)
    {
    case bump_kind::major:
    case bump_kind::minor:
      {
        if (!fin && !cv.snapshot ())
          throw unsupported (cv.beta () ? "beta" : "alpha");

        if (k == bump_kind::major) {mj++; mi = pa = 0;}
        else                       {      mi++; pa = 0;}

        pr = 0;
        break;
      }
    case bump_kind::patch:
      {
        if (!fin)
          throw unsupported (cv.snapshot () ? "snapshot" : "pre-release");

        pa++;
        break;
      }
    case bump_kind::prerelease:
      {
        if (fin)
        {
          pa++;
          pr = 1; // First alpha of the next patch.
        }
        else
          pr++;   // Next alpha or beta.

        break;
      }
    case bump_kind::release:
      {
        if (fin)
          throw version_error ("standard version " + b + " is not a "
                               "snapshot or pre-release");
        pr = 0;
        break;
      }
    case bump_kind::post:
      {
        throw version_scheme_error ("post-release bump is not supported by "
                                    "the standard scheme");
      }
    }

    try
    {
      return standard_version (cv.epoch, mj, mi, pa, pr).string ();
    }
    catch (const invalid_argument& e)
    {
      throw version_error ("unable to increment standard version " + b +
                           ": " + e.what ());
    }
  }

  string
  parse_version (version_scheme s, const string& v)
  {
    switch (s)
    {
    case version_scheme::semver:   return print (parse_semver (v));
    case version_scheme::pep440:   return print (parse_pep440 (v));
    case version_scheme::standard: return parse_standard (v).string ();
    }

    return v; // Can't be here.
  }

  int
  compare_versions (version_scheme s, const string& x, const string& y)
  {
    switch (s)
    {
    case version_scheme::semver:
      return compare (parse_semver (x), parse_semver (y));
    case version_scheme::pep440:
      return compare (parse_pep440 (x), parse_pep440 (y));
    case version_scheme::standard:
      {
        int r (parse_standard (x).compare (parse_standard (y)));
        return r < 0 ? -1 : r > 0 ? 1 : 0;
      }
    }

    return 0; // Can't be here.
  }

  string
  resolve (version_scheme s, const string& b, bump_kind k)
  {
    string r;

    switch (s)
    {
    case version_scheme::semver:   r = resolve_semver   (b, k); break;
    case version_scheme::pep440:   r = resolve_pep440   (b, k); break;
    case version_scheme::standard: r = resolve_standard (b, k); break;
    }

    if (compare_versions (s, r, b) <= 0)
      throw version_error ("resolved version " + r + " does not advance " +
                           to_string (s) + " version " + b);

    return r;
  }
}
