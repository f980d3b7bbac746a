// file      : prel/git.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef PREL_GIT_HXX
#define PREL_GIT_HXX

#include <libbutl/git.hxx>

#include <prel/types.hxx>
#include <prel/utility.hxx>

namespace prel
{
  // All functions that start git process take the minimum supported git
  // version as an argument.
  //
  // Failures of the git process itself (non-zero exit status, inability to
  // execute) are reported as adapter failures.
  //
  // Start git process in the repository (or any directory when just
  // querying git itself).
  //
  template <typename I, typename O, typename E, typename... A>
  process
  start_git (const semantic_version&,
             const dir_path& repo,
             I&& in, O&& out, E&& err,
             A&&... args);

  // Wait for git process to terminate.
  //
  void
  finish_git (process& pr, bool io_read = false);

  // Run git process.
  //
  template <typename... A>
  void
  run_git (const semantic_version&, const dir_path& repo, A&&... args);

  // Run git process and return true if it exits with zero status and false
  // if it exits with the specified (normally 1) status. Fail otherwise. Used
  // for the predicate-like commands (merge-base --is-ancestor, etc).
  //
  template <typename... A>
  bool
  git_test (const semantic_version&,
            const dir_path& repo,
            int false_status,
            A&&... args);

  // Return the first line of the git output. If ignore_error is true, then
  // suppress stderr, ignore (normal) error exit status, and return nullopt.
  //
  template <typename... A>
  optional<string>
  git_line (const semantic_version&,
            const dir_path& repo,
            bool ignore_error,
            A&&... args);

  // Similar to the above but takes the already started git process with a
  // redirected output pipe.
  //
  optional<string>
  git_line (process&&, fdpipe&&, bool ignore_error);

  // Similar to git_line() functions but return all the output lines.
  //
  template <typename... A>
  strings
  git_lines (const semantic_version&,
             const dir_path& repo,
             bool ignore_error,
             A&&... args);

  strings
  git_lines (process&&, fdpipe&&, bool ignore_error);

  // Repository status.
  //
  struct git_repository_status
  {
    string commit;   // Current commit or empty if initial.
    string branch;   // Local branch or empty if detached.

    // Note that unmerged and untracked entries are considered as unstaged.
    //
    bool staged   = false; // Repository has staged changes.
    bool unstaged = false; // Repository has unstaged changes.

    bool
    clean () const {return !staged && !unstaged;}
  };

  // Note: requires git 2.11.0 or higher.
  //
  git_repository_status
  git_status (const dir_path& repo);

  // Return true if git is at least of the specified minimum supported
  // version.
  //
  bool
  git_try_check_version (const semantic_version&);
}

#include <prel/git.txx>

#endif // PREL_GIT_HXX
