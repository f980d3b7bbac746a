// file      : prel/types-parsers.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

// CLI parsers, included into the generated source files.
//

#ifndef PREL_TYPES_PARSERS_HXX
#define PREL_TYPES_PARSERS_HXX

#include <prel/types.hxx>
#include <prel/options-types.hxx>

namespace prel
{
  namespace cli
  {
    class scanner;

    template <typename T>
    struct parser;

    template <>
    struct parser<path>
    {
      static void
      parse (path&, bool&, scanner&);

      static void
      merge (path& b, const path& a) {b = a;}
    };

    template <>
    struct parser<dir_path>
    {
      static void
      parse (dir_path&, bool&, scanner&);

      static void
      merge (dir_path& b, const dir_path& a) {b = a;}
    };

    template <>
    struct parser<stdout_format>
    {
      static void
      parse (stdout_format&, bool&, scanner&);

      static void
      merge (stdout_format& b, const stdout_format& a) {b = a;}
    };

    template <>
    struct parser<version_scheme>
    {
      static void
      parse (version_scheme&, bool&, scanner&);

      static void
      merge (version_scheme& b, const version_scheme& a) {b = a;}
    };

    template <>
    struct parser<bump_kind>
    {
      static void
      parse (bump_kind&, bool&, scanner&);

      static void
      merge (bump_kind& b, const bump_kind& a) {b = a;}
    };
  }
}

#endif // PREL_TYPES_PARSERS_HXX
