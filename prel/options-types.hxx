// file      : prel/options-types.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef PREL_OPTIONS_TYPES_HXX
#define PREL_OPTIONS_TYPES_HXX

#include <string>
#include <ostream>

namespace prel
{
  enum class stdout_format
  {
    lines,
    json
  };

  // Version numbering scheme used to parse, order, and increment versions.
  //
  enum class version_scheme
  {
    semver,   // Semantic Versioning 2.0.0.
    pep440,   // PEP 440 (canonical public versions).
    standard  // build2 standard version.
  };

  std::string
  to_string (version_scheme);

  // Throw invalid_argument if the string is not a known scheme name.
  //
  version_scheme
  to_version_scheme (const std::string&);

  inline std::ostream&
  operator<< (std::ostream& os, version_scheme s)
  {
    return os << to_string (s);
  }

  // Requested version increment.
  //
  enum class bump_kind
  {
    major,
    minor,
    patch,
    prerelease,
    release,    // Drop the pre-release part.
    post        // PEP 440 post-release.
  };

  std::string
  to_string (bump_kind);

  bump_kind
  to_bump_kind (const std::string&);

  inline std::ostream&
  operator<< (std::ostream& os, bump_kind k)
  {
    return os << to_string (k);
  }
}

#endif // PREL_OPTIONS_TYPES_HXX
