// file      : prel/resolver.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef PREL_RESOLVER_HXX
#define PREL_RESOLVER_HXX

#include <prel/types.hxx>
#include <prel/utility.hxx>

#include <prel/options-types.hxx>

namespace prel
{
  // Version errors. The what() string is the complete description suitable
  // for diagnostics.
  //
  class version_error: public invalid_argument
  {
  public:
    using invalid_argument::invalid_argument;
  };

  // Version string does not parse under the scheme.
  //
  class version_format_error: public version_error
  {
  public:
    using version_error::version_error;
  };

  // Bump kind is not applicable under the scheme (or to this particular
  // version under the scheme).
  //
  class version_scheme_error: public version_error
  {
  public:
    using version_error::version_error;
  };

  // Validate the version under the scheme and return it in the canonical
  // form. Throw version_format_error if it does not parse.
  //
  string
  parse_version (version_scheme, const string&);

  // Compare two versions under the scheme's ordering returning a negative
  // value, zero, or a positive value. Throw version_format_error if either
  // does not parse.
  //
  int
  compare_versions (version_scheme, const string&, const string&);

  // Return the version that follows the base version according to the bump
  // kind. The result is guaranteed to compare greater than the base; throw
  // version_error if that cannot be achieved.
  //
  string
  resolve (version_scheme, const string& base, bump_kind);
}

#endif // PREL_RESOLVER_HXX
