// file      : prel/git-repository.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <prel/git-repository.hxx>

#include <prel/git.hxx>
#include <prel/diagnostics.hxx>

using namespace std;
using namespace butl;

namespace prel
{
  // Note: --absolute-git-dir requires git 2.13.0.
  //
  static const semantic_version git_min {2, 13, 0};

  // Quiet flag for the chatty commands.
  //
  static inline cstrings
  quiet ()
  {
    return verb < 2 ? cstrings ({"-q"}) : cstrings ();
  }

  dir_path
  find_repository (const dir_path& d)
  {
    optional<string> r (git_line (git_min,
                                  d,
                                  true /* ignore_error */,
                                  "rev-parse",
                                  "--show-toplevel"));
    if (!r)
      fail_state << d << " is not inside a git working tree";

    try
    {
      return dir_path (move (*r));
    }
    catch (const invalid_path& e)
    {
      fail_adapter << "invalid git working tree path '" << e.path << "'"
                   << endf;
    }
  }

  dir_path
  git_directory (const dir_path& root)
  {
    optional<string> r (git_line (git_min,
                                  root,
                                  false /* ignore_error */,
                                  "rev-parse",
                                  "--absolute-git-dir"));
    if (!r)
      fail_adapter << "unable to obtain git directory of " << root;

    try
    {
      return dir_path (move (*r));
    }
    catch (const invalid_path& e)
    {
      fail_adapter << "invalid git directory path '" << e.path << "'" << endf;
    }
  }

  git_repository::
  git_repository (dir_path r, bool so, bool gs)
      : root_ (move (r)), sign_off_ (so), gpg_sign_ (gs)
  {
  }

  bool git_repository::
  clean ()
  {
    return git_status (root_).clean ();
  }

  string git_repository::
  branch ()
  {
    return git_status (root_).branch;
  }

  bool git_repository::
  branch_exists (const string& b)
  {
    return git_test (git_min,
                     root_,
                     1 /* false_status */,
                     "show-ref", "--verify", "--quiet",
                     "refs/heads/" + b);
  }

  string git_repository::
  head ()
  {
    if (optional<string> r = git_line (git_min,
                                       root_,
                                       false /* ignore_error */,
                                       "rev-parse", "--verify", "HEAD"))
      return move (*r);

    fail_adapter << "unable to obtain HEAD commit in " << root_ << endf;
  }

  optional<string> git_repository::
  resolve (const string& rev)
  {
    return git_line (git_min,
                     root_,
                     true /* ignore_error */,
                     "rev-parse", "--verify", "--quiet",
                     rev + "^{commit}");
  }

  bool git_repository::
  ancestor (const string& a, const string& d)
  {
    return git_test (git_min,
                     root_,
                     1 /* false_status */,
                     "merge-base", "--is-ancestor", a, d);
  }

  string git_repository::
  subject (const string& c)
  {
    optional<string> r (git_line (git_min,
                                  root_,
                                  false /* ignore_error */,
                                  "log", "-1", "--format=%s", c));
    return r ? move (*r) : string ();
  }

  optional<string> git_repository::
  parent (const string& c)
  {
    return resolve (c + "^1");
  }

  bool git_repository::
  commit_exists (const string& id)
  {
    return resolve (id) != nullopt;
  }

  bool git_repository::
  tag_exists (const string& n)
  {
    return git_test (git_min,
                     root_,
                     1 /* false_status */,
                     "show-ref", "--verify", "--quiet",
                     "refs/tags/" + n);
  }

  optional<string> git_repository::
  tag_target (const string& n)
  {
    return resolve ("refs/tags/" + n);
  }

  bool git_repository::
  merging ()
  {
    return git_line (git_min,
                     root_,
                     true /* ignore_error */,
                     "rev-parse", "--verify", "--quiet",
                     "MERGE_HEAD") != nullopt;
  }

  strings git_repository::
  unmerged ()
  {
    return git_lines (git_min,
                      root_,
                      false /* ignore_error */,
                      "diff", "--name-only", "--diff-filter=U");
  }

  void git_repository::
  checkout (const string& b)
  {
    run_git (git_min, root_, "checkout", quiet (), b);
  }

  merge_outcome git_repository::
  merge (const string& s, const string& m)
  {
    merge_outcome r;

    process pr (start_git (git_min,
                           root_,
                           0 /* stdin  */,
                           2 /* stdout */,
                           2 /* stderr */,
                           "merge",
                           quiet (),
                           "--no-ff",
                           "--no-edit",
                           "-m", m,
                           s));

    if (pr.wait ())
      return r;

    // A conflicted merge exits with the 1 status and leaves the unmerged
    // entries. Anything else (untracked files in the way, etc) is a
    // failure.
    //
    const process_exit& e (*pr.exit);

    if (!e.normal ())
      fail_adapter << "process git " << e;

    if (e.code () == 1 && merging ())
    {
      r.paths = unmerged ();

      if (!r.paths.empty ())
      {
        r.conflicted = true;
        return r;
      }
    }

    throw failed (failure::adapter); // Assume git issued diagnostics.
  }

  string git_repository::
  commit (const string& m, const strings& ps)
  {
    if (!ps.empty ())
      run_git (git_min, root_, "add", "--", ps);

    cstrings ops (quiet ());

    if (sign_off_)
      ops.push_back ("--signoff");

    if (gpg_sign_)
      ops.push_back ("--gpg-sign");

    run_git (git_min, root_, "commit", ops, "-m", m);

    return head ();
  }

  string git_repository::
  tag (const string& n, const string& c, const string& m)
  {
    cstrings ops;

    if (!m.empty ())
    {
      ops.push_back (gpg_sign_ ? "--sign" : "--annotate");
      ops.push_back ("-m");
      ops.push_back (m.c_str ());
    }

    run_git (git_min, root_, "tag", ops, n, c);

    if (optional<string> r = git_line (git_min,
                                       root_,
                                       false /* ignore_error */,
                                       "rev-parse", "--verify",
                                       "refs/tags/" + n))
      return move (*r);

    fail_adapter << "unable to obtain tag " << n << " id" << endf;
  }

  void git_repository::
  delete_tag (const string& n)
  {
    run_git (git_min, root_, "tag", "--delete", n);
  }

  void git_repository::
  reset (const string& c)
  {
    run_git (git_min, root_, "reset", quiet (), "--hard", c);
  }

  void git_repository::
  abort_merge ()
  {
    run_git (git_min, root_, "merge", "--abort");
  }

  void git_repository::
  restore (const strings& ps)
  {
    if (!ps.empty ())
      run_git (git_min, root_, "checkout", quiet (), "HEAD", "--", ps);
  }

  bool git_repository::
  exists (const path& p)
  {
    return prel::exists (root_ / p);
  }

  string git_repository::
  read (const path& p)
  {
    path f (root_ / p);

    try
    {
      ifdstream is (f, fdopen_mode::binary);
      string r (is.read_text ());
      is.close ();
      return r;
    }
    catch (const io_error& e)
    {
      fail_adapter << "unable to read " << f << ": " << e << endf;
    }
  }

  void git_repository::
  write (const path& p, const string& s)
  {
    path f (root_ / p);

    try
    {
      ofdstream os (f, fdopen_mode::binary);
      os << s;
      os.close ();
    }
    catch (const io_error& e)
    {
      fail_adapter << "unable to write " << f << ": " << e;
    }
  }
}
