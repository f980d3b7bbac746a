// file      : prel/utility.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <prel/utility.hxx>

#include <libbutl/fdstream.hxx>

#include <prel/diagnostics.hxx>

using namespace std;
using namespace butl;

namespace prel
{
  const dir_path prel_dir     ("prel");
  const path     attempt_file ("attempt.manifest");
  const path     lock_file    ("lock");
  const path     options_file ("prel.options");

  dir_path
  current_directory ()
  {
    try
    {
      return dir_path::current_directory ();
    }
    catch (const system_error& e)
    {
      fail << "unable to obtain current directory: " << e << endf;
    }
  }

  dir_path
  home_directory ()
  {
    try
    {
      return dir_path::home_directory ();
    }
    catch (const system_error& e)
    {
      fail << "unable to obtain home directory: " << e << endf;
    }
  }

  dir_path&
  normalize (dir_path& d, const char* what)
  {
    try
    {
      d.complete ().normalize ();
    }
    catch (const invalid_path& e)
    {
      fail << "invalid " << what << ' ' << e.path;
    }
    catch (const system_error& e)
    {
      fail << "unable to obtain current directory: " << e;
    }

    return d;
  }

  bool
  exists (const path& f, bool ignore_error)
  {
    try
    {
      return file_exists (f, true /* follow_symlinks */, ignore_error);
    }
    catch (const system_error& e)
    {
      fail << "unable to stat path " << f << ": " << e << endf;
    }
  }

  bool
  exists (const dir_path& d, bool ignore_error)
  {
    try
    {
      return dir_exists (d, ignore_error);
    }
    catch (const system_error& e)
    {
      fail << "unable to stat path " << d << ": " << e << endf;
    }
  }

  void
  mk_p (const dir_path& d)
  {
    if (verb >= 3)
      text << "mkdir -p " << d;

    try
    {
      try_mkdir_p (d);
    }
    catch (const system_error& e)
    {
      fail << "unable to create directory " << d << ": " << e;
    }
  }

  void
  rm (const path& f, uint16_t v)
  {
    if (verb >= v)
      text << "rm " << f;

    try
    {
      if (try_rmfile (f) == rmfile_status::not_exist)
        fail << "unable to remove file " << f << ": file does not exist";
    }
    catch (const system_error& e)
    {
      fail << "unable to remove file " << f << ": " << e;
    }
  }

  void
  mv (const path& from, const path& to, uint16_t v)
  {
    if (verb >= v)
      text << "mv " << from << ' ' << to;

    try
    {
      mvfile (from,
              to,
              cpflags::overwrite_content | cpflags::overwrite_permissions);
    }
    catch (const system_error& e)
    {
      fail << "unable to move file " << from << " to " << to << ": " << e;
    }
  }

  fdpipe
  open_pipe ()
  {
    try
    {
      return fdopen_pipe ();
    }
    catch (const io_error& e)
    {
      fail << "unable to open pipe: " << e << endf;
    }
  }

  auto_fd
  open_null ()
  {
    try
    {
      return fdopen_null ();
    }
    catch (const io_error& e)
    {
      fail << "unable to open null device: " << e << endf;
    }
  }

  string
  substitute (const string& f, const substitutions& vs)
  {
    string r;

    for (size_t i (0), n (f.size ()); i != n; ++i)
    {
      char c (f[i]);

      if (c == '}')
      {
        if (i + 1 == n || f[i + 1] != '}')
          throw invalid_argument ("unbalanced '}'");

        r += '}';
        ++i;
        continue;
      }

      if (c != '{')
      {
        r += c;
        continue;
      }

      if (i + 1 != n && f[i + 1] == '{')
      {
        r += '{';
        ++i;
        continue;
      }

      size_t e (f.find ('}', i + 1));

      if (e == string::npos)
        throw invalid_argument ("unterminated placeholder");

      string name (f, i + 1, e - i - 1);

      auto j (find_if (vs.begin (), vs.end (),
                       [&name] (const pair<const char*, string>& v)
                       {
                         return name == v.first;
                       }));

      if (j == vs.end ())
        throw invalid_argument ("unknown placeholder '{" + name + "}'");

      r += j->second;
      i = e;
    }

    return r;
  }
}
