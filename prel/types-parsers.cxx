// file      : prel/types-parsers.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <prel/types-parsers.hxx>

#include <prel/prel-options.hxx> // prel::cli namespace

namespace prel
{
  namespace cli
  {
    template <typename T>
    static void
    parse_path (T& x, scanner& s)
    {
      const char* o (s.next ());

      if (!s.more ())
        throw missing_value (o);

      const char* v (s.next ());

      try
      {
        x = T (v);

        if (x.empty ())
          throw invalid_value (o, v);
      }
      catch (const invalid_path&)
      {
        throw invalid_value (o, v);
      }
    }

    void parser<path>::
    parse (path& x, bool& xs, scanner& s)
    {
      xs = true;
      parse_path (x, s);
    }

    void parser<dir_path>::
    parse (dir_path& x, bool& xs, scanner& s)
    {
      xs = true;
      parse_path (x, s);
    }

    void parser<stdout_format>::
    parse (stdout_format& r, bool& xs, scanner& s)
    {
      const char* o (s.next ());

      if (!s.more ())
        throw missing_value (o);

      string v (s.next ());

      if      (v == "lines") r = stdout_format::lines;
      else if (v == "json")  r = stdout_format::json;
      else throw invalid_value (o, v);

      xs = true;
    }

    // Parse an enumerator using its string conversion function, which is
    // expected to throw invalid_argument on an unknown name.
    //
    template <typename E>
    static void
    parse_enum (E& r, scanner& s, E (*conv) (const string&))
    {
      const char* o (s.next ());

      if (!s.more ())
        throw missing_value (o);

      string v (s.next ());

      try
      {
        r = conv (v);
      }
      catch (const invalid_argument&)
      {
        throw invalid_value (o, v);
      }
    }

    void parser<version_scheme>::
    parse (version_scheme& r, bool& xs, scanner& s)
    {
      parse_enum (r, s, &to_version_scheme);
      xs = true;
    }

    void parser<bump_kind>::
    parse (bump_kind& r, bool& xs, scanner& s)
    {
      parse_enum (r, s, &to_bump_kind);
      xs = true;
    }
  }
}
