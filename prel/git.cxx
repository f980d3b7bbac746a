// file      : prel/git.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <prel/git.hxx>

#include <libbutl/git.hxx>

#include <prel/diagnostics.hxx>

using namespace butl;

namespace prel
{
  static process_path               git_path;
  static optional<semantic_version> git_ver;

  bool
  git_try_check_version (const semantic_version& min_ver)
  {
    // Query and cache git version on the first call.
    //
    if (!git_ver)
    {
      // The version query itself goes through start_git() and so checks
      // against this placeholder.
      //
      git_ver = semantic_version ();

      optional<string> s (
        git_line (*git_ver,
                  dir_path (".") /* repo */,
                  false          /* ignore_error */,
                  "--version"));

      if (!s || !(git_ver = git_version (*s)))
        fail_adapter << "unable to obtain git version";
    }

    // Note that we don't expect the min_ver to contain the build component,
    // that doesn't matter functionality-wise for git.
    //
    return *git_ver >= min_ver;
  }

  // As above but issue diagnostics and fail if git is older than the
  // specified minimum supported version.
  //
  void
  git_check_version (const semantic_version& min_ver)
  {
    if (!git_try_check_version (min_ver))
    {
      assert (git_ver); // Must have been cached by git_try_check_version().

      fail_adapter << "unsupported git version " << *git_ver <<
        info << "minimum supported version is " << min_ver << endf;
    }
  }

  // Return git process path searching for it on the first call.
  //
  const process_path&
  git_search ()
  {
    tracer trace ("git_search");

    if (git_path.empty ())
    {
      git_path = process::path_search ("git", true /* init */);

      l4 ([&]{trace << "git: '" << git_path.effect << "'";});
    }

    return git_path;
  }

  void
  finish_git (process& pr, bool io_read)
  {
    if (!pr.wait ())
    {
      const process_exit& e (*pr.exit);

      if (e.normal ())
        throw failed (failure::adapter); // Assume git issued diagnostics.

      fail_adapter << "process git " << e;
    }

    if (io_read)
      fail_adapter << "error reading git output";
  }

  optional<string>
  git_line (process&& pr, fdpipe&& pipe, bool ie)
  {
    optional<string> r;

    bool io (false);
    try
    {
      pipe.out.close ();
      ifdstream is (move (pipe.in), fdstream_mode::skip, ifdstream::badbit);

      string l;
      if (!eof (getline (is, l)))
        r = move (l);

      is.close (); // Detect errors.
    }
    catch (const io_error&)
    {
      io = true; // Presumably git failed so check that first.
    }

    // Note: cannot use finish_git() since ignoring normal error.
    //
    if (!pr.wait ())
    {
      const process_exit& e (*pr.exit);

      if (!e.normal ())
        fail_adapter << "process git " << e;

      if (ie)
        r = nullopt;
      else
        throw failed (failure::adapter); // Assume git issued diagnostics.
    }
    else if (io)
      fail_adapter << "unable to read git output";

    return r;
  }

  strings
  git_lines (process&& pr, fdpipe&& pipe, bool ie)
  {
    strings r;

    bool io (false);
    try
    {
      pipe.out.close ();
      ifdstream is (move (pipe.in), fdstream_mode::skip, ifdstream::badbit);

      for (string l; !eof (getline (is, l)); )
        r.push_back (move (l));

      is.close (); // Detect errors.
    }
    catch (const io_error&)
    {
      io = true; // Presumably git failed so check that first.
    }

    if (!pr.wait ())
    {
      const process_exit& e (*pr.exit);

      if (!e.normal ())
        fail_adapter << "process git " << e;

      if (ie)
        r.clear ();
      else
        throw failed (failure::adapter); // Assume git issued diagnostics.
    }
    else if (io)
      fail_adapter << "unable to read git output";

    return r;
  }

  git_repository_status
  git_status (const dir_path& repo)
  {
    git_repository_status r;

    // git-status --porcelain=2 (available since git 2.11.0) gives us all the
    // information with a single invocation.
    //
    fdpipe pipe (open_pipe ()); // Text mode seems appropriate.

    process pr (start_git (semantic_version {2, 11, 0},
                           repo,
                           0     /* stdin  */,
                           pipe  /* stdout */,
                           2     /* stderr */,
                           "status",
                           "--porcelain=2",
                           "--branch"));

    // Shouldn't throw, unless something is severely damaged.
    //
    pipe.out.close ();

    bool io (false);
    try
    {
      ifdstream is (move (pipe.in), fdstream_mode::skip, ifdstream::badbit);

      // Lines starting with '#' are headers (come first) with any other line
      // indicating some kind of change.
      //
      // The headers we are interested in are:
      //
      // # branch.oid <commit>  | (initial)       Current commit.
      // # branch.head <branch> | (detached)      Current branch.
      //
      for (string l; !eof (getline (is, l)); )
      {
        char c (l[0]);

        if (c == '#')
        {
          if (l.compare (2, 10, "branch.oid") == 0)
          {
            r.commit = string (l, 13);

            if (r.commit == "(initial)")
              r.commit.clear ();
          }
          else if (l.compare (2, 11, "branch.head") == 0)
          {
            r.branch = string (l, 14);

            if (r.branch == "(detached)")
              r.branch.clear ();
          }

          continue; // Some other header.
        }

        // Change line. For tracked entries it has the following format:
        //
        // 1 <XY> ...
        // 2 <XY> ...
        //
        // Where <XY> is a two-character field with X describing the staged
        // status and Y -- unstaged and with '.' indicating no change.
        //
        // All other lines (untracked/unmerged entries) we treat as an
        // indication of an unstaged change (see git-status(1) for details).
        //
        if (c == '1' || c == '2')
        {
          if (l[2] != '.') r.staged   = true;
          if (l[3] != '.') r.unstaged = true;
        }
        else
          r.unstaged = true;
      }

      is.close (); // Detect errors.
    }
    catch (const io_error&)
    {
      // Presumably the child process failed and issued diagnostics so let
      // finish_git() try to deal with that.
      //
      io = true;
    }

    finish_git (pr, io);

    return r;
  }
}
