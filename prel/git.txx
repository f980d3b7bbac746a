// file      : prel/git.txx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

namespace prel
{
  template <typename... A>
  void
  run_git (const semantic_version& min_ver, const dir_path& repo, A&&... args)
  {
    // We don't expect git to print anything useful to stdout, as the caller
    // would use start_git() and pipe otherwise. Thus, let's redirect stdout
    // to stderr for good measure, as git is known to print some
    // informational messages (merge summaries, etc) to stdout.
    //
    process pr (start_git (min_ver,
                           repo,
                           0 /* stdin  */,
                           2 /* stdout */,
                           2 /* stderr */,
                           forward<A> (args)...));

    finish_git (pr);
  }

  void
  git_check_version (const semantic_version& min_ver);

  const process_path&
  git_search ();

  template <typename I, typename O, typename E, typename... A>
  process
  start_git (const semantic_version& min_ver,
             const dir_path& repo,
             I&& in, O&& out, E&& err,
             A&&... args)
  {
    git_check_version (min_ver);

    try
    {
      // Make sure git never stops to ask for a commit or tag message, even
      // if we forget to pass one.
      //
      const char* vars[] = {"GIT_EDITOR=true", nullptr};
      process_env pe (git_search (), vars);

      return process_start_callback (
        [] (const char* const args[], size_t n)
        {
          if (verb >= 2)
            print_process (args, n);
        },
        forward<I> (in), forward<O> (out), forward<E> (err),
        pe,
        "-C", repo,
        forward<A> (args)...);
    }
    catch (const process_error& e)
    {
      fail_adapter << "unable to execute git: " << e << endf;
    }
  }

  template <typename... A>
  bool
  git_test (const semantic_version& min_ver,
            const dir_path& repo,
            int fs,
            A&&... args)
  {
    process pr (start_git (min_ver,
                           repo,
                           0 /* stdin  */,
                           2 /* stdout */,
                           2 /* stderr */,
                           forward<A> (args)...));

    // Note: cannot use finish_git() since one of the error statuses is
    // expected.
    //
    if (pr.wait ())
      return true;

    const process_exit& e (*pr.exit);

    if (e.normal () && e.code () == fs)
      return false;

    if (!e.normal ())
      fail_adapter << "process git " << e;

    throw failed (failure::adapter); // Assume git issued diagnostics.
  }

  template <typename... A>
  optional<string>
  git_line (const semantic_version& min_ver,
            const dir_path& repo,
            bool ie,
            A&&... args)
  {
    fdpipe pipe (open_pipe ());
    auto_fd null (ie ? open_null () : auto_fd ());

    process pr (start_git (min_ver,
                           repo,
                           0                    /* stdin  */,
                           pipe                 /* stdout */,
                           ie ? null.get () : 2 /* stderr */,
                           forward<A> (args)...));

    return git_line (move (pr), move (pipe), ie);
  }

  template <typename... A>
  strings
  git_lines (const semantic_version& min_ver,
             const dir_path& repo,
             bool ie,
             A&&... args)
  {
    fdpipe pipe (open_pipe ());
    auto_fd null (ie ? open_null () : auto_fd ());

    process pr (start_git (min_ver,
                           repo,
                           0                    /* stdin  */,
                           pipe                 /* stdout */,
                           ie ? null.get () : 2 /* stderr */,
                           forward<A> (args)...));

    return git_lines (move (pr), move (pipe), ie);
  }
}
