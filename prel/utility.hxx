// file      : prel/utility.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef PREL_UTILITY_HXX
#define PREL_UTILITY_HXX

#include <string>    // to_string()
#include <utility>   // move(), forward()
#include <cassert>   // assert()
#include <algorithm> // find(), find_if()

#include <libbutl/ft/lang.hxx>

#include <libbutl/utility.hxx>         // trim(), reverse_iterate(), etc
#include <libbutl/fdstream.hxx>
#include <libbutl/filesystem.hxx>
#include <libbutl/default-options.hxx>

#include <libbutl/manifest-parser.hxx>
#include <libbutl/manifest-serializer.hxx>

#include <prel/types.hxx>
#include <prel/version.hxx>

namespace prel
{
  using std::move;
  using std::forward;
  using std::to_string;

  using std::find;
  using std::find_if;

  // <libbutl/utility.hxx>
  //
  using butl::trim;
  using butl::reverse_iterate;
  using butl::getenv;

  // <libbutl/filesystem.hxx>
  //
  using butl::auto_rmfile;

  // <libbutl/default-options.hxx>
  //
  using butl::load_default_options;
  using butl::merge_default_options;

  // Widely-used paths.
  //
  extern const dir_path prel_dir;      // prel/ (inside the git directory)
  extern const path     attempt_file;  // attempt.manifest
  extern const path     lock_file;     // lock
  extern const path     options_file;  // prel.options

  // Path.
  //
  dir_path
  current_directory ();

  dir_path
  home_directory ();

  // Normalize a directory path. Also make the relative path absolute using
  // the current directory.
  //
  dir_path&
  normalize (dir_path&, const char* what);

  inline dir_path
  normalize (const dir_path& d, const char* what)
  {
    dir_path r (d);
    return move (normalize (r, what));
  }

  // Filesystem.
  //
  bool
  exists (const path&, bool ignore_error = false);

  bool
  exists (const dir_path&, bool ignore_error = false);

  void
  mk_p (const dir_path&);

  void
  rm (const path&, uint16_t verbosity = 3);

  // Move the file over the existing one, if any.
  //
  void
  mv (const path& from, const path& to, uint16_t verbosity = 3);

  // File descriptor streams.
  //
  fdpipe
  open_pipe ();

  auto_fd
  open_null ();

  // Manifest parsing and serialization.
  //
  // Parsing errors (including the semantic ones detected by the T's parsing
  // constructor) are reported as corrupt record failures since the only
  // manifest we parse is the one we wrote ourselves.
  //
  template <typename T>
  T
  parse_manifest (const path&,
                  const char* what,
                  function<butl::manifest_parser::filter_function> = {});

  template <typename T>
  T
  parse_manifest (istream&,
                  const string& name,
                  const char* what,
                  function<butl::manifest_parser::filter_function> = {});

  template <typename T>
  void
  serialize_manifest (
    const T&,
    const path&,
    const char* what,
    function<butl::manifest_serializer::filter_function> = {});

  template <typename T>
  void
  serialize_manifest (
    const T&,
    ostream&,
    const string& name,
    const char* what,
    function<butl::manifest_serializer::filter_function> = {});

  // Substitute the {<name>} placeholders in the format string with the
  // corresponding values. Throw invalid_argument if a placeholder is
  // unknown or unterminated. The {{ and }} sequences stand for the literal
  // braces.
  //
  using substitutions = small_vector<pair<const char*, string>, 2>;

  string
  substitute (const string& format, const substitutions&);
}

#include <prel/utility.txx>

#endif // PREL_UTILITY_HXX
