// file      : prel/options-types.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <prel/options-types.hxx>

#include <stdexcept> // invalid_argument

using namespace std;

namespace prel
{
  string
  to_string (version_scheme s)
  {
    switch (s)
    {
    case version_scheme::semver:   return "semver";
    case version_scheme::pep440:   return "pep440";
    case version_scheme::standard: return "standard";
    }

    return string (); // Can't be here.
  }

  version_scheme
  to_version_scheme (const string& s)
  {
         if (s == "semver")   return version_scheme::semver;
    else if (s == "pep440")   return version_scheme::pep440;
    else if (s == "standard") return version_scheme::standard;
    else throw invalid_argument ("invalid version scheme '" + s + '\'');
  }

  string
  to_string (bump_kind k)
  {
    switch (k)
    {
    case bump_kind::major:      return "major";
    case bump_kind::minor:      return "minor";
    case bump_kind::patch:      return "patch";
    case bump_kind::prerelease: return "prerelease";
    case bump_kind::release:    return "release";
    case bump_kind::post:       return "post";
    }

    return string (); // Can't be here.
  }

  bump_kind
  to_bump_kind (const string& s)
  {
         if (s == "major")      return bump_kind::major;
    else if (s == "minor")      return bump_kind::minor;
    else if (s == "patch")      return bump_kind::patch;
    else if (s == "prerelease") return bump_kind::prerelease;
    else if (s == "release")    return bump_kind::release;
    else if (s == "post")       return bump_kind::post;
    else throw invalid_argument ("invalid bump kind '" + s + '\'');
  }
}
