// file      : prel/prel.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef _WIN32
#  include <signal.h> // signal()
#endif

#include <limits>
#include <cerrno>
#include <iostream>
#include <exception>   // set_terminate(), terminate_handler

#include <libbutl/backtrace.hxx> // backtrace()

#include <prel/types.hxx>
#include <prel/utility.hxx>

#include <prel/diagnostics.hxx>
#include <prel/prel-options.hxx>

#include <prel/status.hxx>
#include <prel/release.hxx>
#include <prel/state-store.hxx>
#include <prel/git-repository.hxx>

using namespace std;
using namespace butl;
using namespace prel;

namespace prel
{
  int
  main (int argc, char* argv[]);

  // Print the sample default options file.
  //
  static void
  print_sample_config (ostream& os)
  {
    os << "# Default options for prel. Place this file into the .build2/\n"
       << "# subdirectory of the repository root (or of its parent or home\n"
       << "# directory) as " << options_file << ".\n"
       << "#\n"
       << "--source-branch develop\n"
       << "--target-branch master\n"
       << "\n"
       << "# Version scheme (semver, pep440, standard) and the default\n"
       << "# increment (major, minor, patch, prerelease, release, post).\n"
       << "#\n"
       << "--scheme semver\n"
       << "--bump minor\n"
       << "\n"
       << "# Files that embed the version.\n"
       << "#\n"
       << "--version-file VERSION\n"
       << "#--version-format src/version.txt=Version: {version}\n"
       << "#--version-pattern setup.py=version=\"([^\"]+)\"\n"
       << "\n"
       << "#--merge-message Merge branch '{source}' into {target}\n"
       << "#--commit-message Release version {version}\n"
       << "#--tag-format v{version}\n"
       << "#--tag-message Tag version {version}\n"
       << "#--no-annotate\n"
       << "#--sign-off\n"
       << "#--gpg-sign\n"
       << "#--keep-record\n"
       << "#--stale-days 30\n";
  }
}

// Command line arguments starting position.
//
// The default options files positions are assigned below this value (see
// load_default_options() for details) so we "reserve" the first half of the
// size_t value range for them and the second half for the command line
// arguments positions.
//
static const size_t args_pos (numeric_limits<size_t>::max () / 2);

// Print backtrace if terminating due to an unhandled exception. Note that
// custom_terminate is non-static and not a lambda to reduce the noise.
//
static terminate_handler default_terminate;

void
custom_terminate ()
{
  *diag_stream << backtrace ();

  if (default_terminate != nullptr)
    default_terminate ();
}

int prel::
main (int argc, char* argv[])
try
{
  using namespace cli;

  using prel::optional;
  using prel::getenv;

  tracer trace ("main");

  default_terminate = set_terminate (custom_terminate);

  // On POSIX ignore SIGPIPE which is signaled to a pipe-writing process if
  // the pipe reading end is closed. Note that by default this signal
  // terminates a process.
  //
#ifndef _WIN32
  if (signal (SIGPIPE, SIG_IGN) == SIG_ERR)
    fail << "unable to ignore broken pipe (SIGPIPE) signal: "
         << system_error (errno, generic_category ()); // Sanitize.
#endif

  argv_file_scanner scan (argc, argv, "--options-file", false, args_pos);

  options o;
  o.parse (scan);

  if (scan.more ())
    fail_config << "unexpected argument '" << scan.next () << "'" <<
      info << "run 'prel --help' for more information";

  auto verbosity = [&o] ()
  {
    return o.verbose_specified ()
           ? o.verbose ()
           : o.V () ? 3 : o.v () ? 2 : o.quiet () ? 0 : 1;
  };

  // Note that the final verbosity level can only be calculated after the
  // default options are loaded and merged (see below).
  //
  verb = verbosity ();

  if (o.version ())
  {
    cout << "prel " << PREL_VERSION_ID << endl
         << "libbutl " << LIBBUTL_VERSION_ID << endl
         << "Copyright (c) " << PREL_COPYRIGHT << "." << endl
         << "This is free software released under the MIT license." << endl;
    return 0;
  }

  if (o.help ())
  {
    cout << "usage: prel [<options>]" << endl
         << endl;

    options::print_usage (cout);
    return 0;
  }

  if (o.sample_config ())
  {
    print_sample_config (cout);
    return 0;
  }

  dir_path root (
    find_repository (o.directory_specified ()
                     ? normalize (o.directory (), "repository")
                     : current_directory ()));

  l4 ([&]{trace << "repository root: " << root;});

  // Load the default options files, unless --no-default-options is specified
  // on the command line or the PREL_DEF_OPT environment variable is set to a
  // value other than 'true' or '1'.
  //
  optional<string> env_def (getenv ("PREL_DEF_OPT"));

  if (!o.no_default_options () &&
      (!env_def || *env_def == "true" || *env_def == "1"))
  try
  {
    optional<dir_path> extra;
    if (o.default_options_specified ())
    {
      extra = o.default_options ();

      // Note that load_default_options() expects absolute and normalized
      // directory.
      //
      try
      {
        if (extra->relative ())
          extra->complete ();

        extra->normalize ();
      }
      catch (const invalid_path& e)
      {
        fail_config << "invalid --default-options value " << e.path;
      }
    }

    default_options<options> dos (
      load_default_options<options,
                           cli::argv_file_scanner,
                           cli::unknown_mode> (
        nullopt /* sys_dir */,
        home_directory (),
        extra,
        default_options_files {{options_file}, root},
        [&trace, &verbosity] (const path& f, bool r, bool o)
        {
          if (verbosity () >= 3)
          {
            if (o)
              trace << "treating " << f << " as " << (r ? "remote" : "local");
            else
              trace << "loading " << (r ? "remote " : "local ") << f;
          }
        },
        "--options-file",
        args_pos,
        1024));

    // Fail if the options that select the repository or the command appear
    // in a default options file.
    //
    o = merge_default_options (
      dos,
      o,
      [] (const default_options_entry<options>& e, const options&)
      {
        const options& d (e.options);

        auto forbid = [&e] (const char* n, bool v)
        {
          if (v)
            fail_config (e.file) << n << " in default options file";
        };

        forbid ("--directory|-d", d.directory_specified ());
        forbid ("--status",       d.status ());
        forbid ("--edit",         d.edit ());
        forbid ("--continue",     d.continue_ ());
        forbid ("--abort",        d.abort ());
      });
  }
  catch (const invalid_argument& e)
  {
    fail_config << "unable to load default options files: " << e;
  }
  catch (const pair<path, system_error>& e)
  {
    fail_config << "unable to load default options files: " << e.first
                << ": " << e.second;
  }

  verb = verbosity ();

  // Deduce the command.
  //
  command c (command::run);
  {
    size_t n (0);

    if (o.status ())    {c = command::status;    ++n;}
    if (o.edit ())      {c = command::edit;      ++n;}
    if (o.continue_ ()) {c = command::continue_; ++n;}
    if (o.abort ())     {c = command::abort;     ++n;}

    if (n > 1)
      fail_config << "multiple commands specified" <<
        info << "specify one of --status, --edit, --continue, --abort";
  }

  git_repository repo (root, o.sign_off (), o.gpg_sign ());
  state_store store (git_directory (root) / prel_dir);

  // The status report is read-only and so doesn't need the lock.
  //
  if (c == command::status)
    return cmd_status (o, repo, store, cout);

  state_lock l (store.lock ());
  return cmd_release (o, c, repo, store);
}
catch (const failed& e)
{
  return exit_code (e.kind); // Diagnostics has already been issued.
}
catch (const cli::exception& e)
{
  error << e;
  return exit_config;
}

int
main (int argc, char* argv[])
{
  return prel::main (argc, argv);
}
