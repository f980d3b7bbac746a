// file      : prel/utility.txx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <prel/diagnostics.hxx>

namespace prel
{
  // *_manifest()
  //
  template <typename T>
  T
  parse_manifest (const path& f,
                  const char* what,
                  function<butl::manifest_parser::filter_function> ff)
  {
    using namespace butl;

    try
    {
      if (!file_exists (f))
        fail << what << " manifest file " << f << " does not exist";

      ifdstream ifs (f);
      return parse_manifest<T> (ifs, f.string (), what, move (ff));
    }
    catch (const system_error& e) // EACCES, etc.
    {
      fail << "unable to access " << what << " manifest " << f << ": " << e
           << endf;
    }
  }

  template <typename T>
  T
  parse_manifest (istream& is,
                  const string& name,
                  const char* what,
                  function<butl::manifest_parser::filter_function> ff)
  {
    using namespace butl;

    try
    {
      manifest_parser p (is, name, move (ff));
      return T (p);
    }
    catch (const manifest_parsing& e)
    {
      fail_corrupt (name, e.line, e.column) << "invalid " << what
                                            << " manifest: "
                                            << e.description <<
        info << "repair or remove this file manually" << endf;
    }
    catch (const io_error& e)
    {
      fail << "unable to read " << what << " manifest " << name << ": " << e
           << endf;
    }
  }

  template <typename T>
  void
  serialize_manifest (const T& m,
                      const path& f,
                      const char* what,
                      function<butl::manifest_serializer::filter_function> ff)
  {
    using namespace std;
    using namespace butl;

    try
    {
      ofdstream ofs (f, fdopen_mode::binary);
      auto_rmfile arm (f); // Try to remove on failure ignoring errors.

      serialize_manifest (m, ofs, f.string (), what, move (ff));

      ofs.close ();
      arm.cancel ();
    }
    catch (const system_error& e) // EACCES, etc.
    {
      fail << "unable to access " << what << " manifest " << f << ": " << e;
    }
  }

  template <typename T>
  void
  serialize_manifest (const T& m,
                      ostream& os,
                      const string& name,
                      const char* what,
                      function<butl::manifest_serializer::filter_function> ff)
  {
    using namespace butl;

    try
    {
      manifest_serializer s (os, name, false /* long_lines */, move (ff));
      m.serialize (s);
      return;
    }
    catch (const manifest_serialization& e)
    {
      fail << "invalid " << what << " manifest: " << e.description;
    }
    catch (const io_error& e)
    {
      fail << "unable to write to " << what << " manifest " << name << ": "
           << e;
    }
  }
}
