// file      : prel/version-file.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <prel/version-file.hxx>

#include <sstream>

#include <libbutl/regex.hxx> // operator<<(ostream, regex_error)

#include <prel/diagnostics.hxx>

using namespace std;
using namespace butl;

namespace prel
{
  // Escape the regex special characters.
  //
  static string
  regex_escape (const string& s)
  {
    string r;

    for (char c: s)
    {
      if (string ("\\^$.|?*+()[]{}").find (c) != string::npos)
        r += '\\';

      r += c;
    }

    return r;
  }

  version_file::
  version_file (path f, kind_type k, string fmt)
      : file (move (f)), kind (k), format (move (fmt))
  {
    switch (kind)
    {
    case plain: break;
    case formatted:
      {
        // Substitute the version with a character that cannot appear in the
        // format and use the result to build the regex, turning the literal
        // parts into the regex literals.
        //
        const char mark ('\x01');

        string s (
          substitute (format, substitutions {{"version", string (1, mark)}}));

        if (s.find (mark) == string::npos)
          throw invalid_argument ("no {version} placeholder");

        string re;
        for (size_t b (0);;)
        {
          size_t e (s.find (mark, b));
          re += regex_escape (string (s, b, e == string::npos ? e : e - b));

          if (e == string::npos)
            break;

          re += "(.*)";
          b = e + 1;
        }

        regex_ = regex (re);
        break;
      }
    case pattern:
      {
        try
        {
          regex_ = regex (format);
        }
        catch (const regex_error& e)
        {
          ostringstream os;
          os << "invalid regex" << e;
          throw invalid_argument (os.str ());
        }

        break;
      }
    }
  }

  strings version_file::
  versions (const string& c) const
  {
    strings r;

    switch (kind)
    {
    case plain:
      {
        r.push_back (c);
        trim (r.back ());
        break;
      }
    case formatted:
      {
        smatch m;
        if (regex_search (c, m, regex_))
        {
          for (size_t i (1); i != m.size (); ++i)
            r.push_back (m[i].str ());
        }

        break;
      }
    case pattern:
      {
        for (sregex_iterator i (c.begin (), c.end (), regex_), e; i != e; ++i)
        {
          const smatch& m (*i);
          r.push_back (m.size () > 1 && m[1].matched
                       ? m[1].str ()
                       : m[0].str ());
        }

        break;
      }
    }

    return r;
  }

  string version_file::
  rewrite (const string& c, const string& v) const
  {
    switch (kind)
    {
    case plain:
      {
        // Preserve the trailing newline, if any.
        //
        size_t n (c.find_last_not_of (" \t\r\n"));
        return v + (n != string::npos ? string (c, n + 1) : c);
      }
    case formatted:
      {
        return substitute (format, substitutions {{"version", v}});
      }
    case pattern:
      {
        string r;
        auto b (c.begin ());

        for (sregex_iterator i (c.begin (), c.end (), regex_), e; i != e; ++i)
        {
          const smatch& m (*i);
          size_t g (m.size () > 1 && m[1].matched ? 1 : 0);

          r.append (b, m[g].first);
          r += v;
          b = m[g].second;
        }

        r.append (b, c.end ());
        return r;
      }
    }

    return c; // Can't be here.
  }

  version_files
  parse_version_files (const options& o)
  {
    version_files r;

    auto add = [&r] (const string& f,
                     version_file::kind_type k,
                     const string& fmt,
                     const char* opt)
    {
      path p;
      try
      {
        p = path (f);
      }
      catch (const invalid_path& e)
      {
        fail_config << "invalid " << opt << " file path '" << e.path << "'";
      }

      if (p.empty () || p.absolute ())
        fail_config << "invalid " << opt << " file path '" << f << "'" <<
          info << "path relative to the repository root expected";

      for (const version_file& v: r)
      {
        if (v.file == p)
          fail_config << "multiple version options specified for file " << p;
      }

      try
      {
        r.emplace_back (move (p), k, fmt);
      }
      catch (const invalid_argument& e)
      {
        fail_config << "invalid " << opt << " value for file " << f << ": "
                    << e;
      }
    };

    for (const string& f: o.version_file ())
      add (f, version_file::plain, string (), "--version-file");

    for (const auto& f: o.version_format ())
      add (f.first, version_file::formatted, f.second, "--version-format");

    for (const auto& f: o.version_pattern ())
      add (f.first, version_file::pattern, f.second, "--version-pattern");

    if (r.empty ())
      fail_config << "no version files specified" <<
        info << "use --version-file, --version-format, or --version-pattern";

    return r;
  }

  string
  read_version (repository& rep, const version_files& fs)
  {
    string r;
    const path* rf (nullptr);

    for (const version_file& f: fs)
    {
      strings vs (f.versions (rep.read (f.file)));

      if (vs.empty ())
        fail_version << "no version found in " << f.file;

      for (const string& v: vs)
      {
        if (v.empty ())
          fail_version << "empty version in " << f.file;

        if (rf == nullptr)
        {
          r = v;
          rf = &f.file;
        }
        else if (v != r)
          fail_version << "inconsistent versions " << r << " in " << *rf
                       << " and " << v << " in " << f.file;
      }
    }

    return r;
  }

  void
  write_version (repository& rep, const version_files& fs, const string& v)
  {
    for (const version_file& f: fs)
      rep.write (f.file, f.rewrite (rep.read (f.file), v));
  }

  strings
  version_paths (const version_files& fs)
  {
    strings r;
    for (const version_file& f: fs)
      r.push_back (f.file.string ());
    return r;
  }
}
