// file      : prel/git-repository.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef PREL_GIT_REPOSITORY_HXX
#define PREL_GIT_REPOSITORY_HXX

#include <prel/types.hxx>
#include <prel/utility.hxx>

#include <prel/repository.hxx>

namespace prel
{
  // Return the working tree root of the git repository containing the
  // specified directory. Fail (invalid repository state) if it is not
  // inside a working tree.
  //
  dir_path
  find_repository (const dir_path&);

  // Return the absolute path of the git directory (normally <root>/.git/)
  // of the working tree.
  //
  dir_path
  git_directory (const dir_path& root);

  // Repository implementation that runs the git program.
  //
  class git_repository: public repository
  {
  public:
    // If sign_off is true, then add the Signed-off-by trailer to commits. If
    // gpg_sign is true, then sign commits and annotated tags.
    //
    git_repository (dir_path root, bool sign_off, bool gpg_sign);

    const dir_path&
    root () const {return root_;}

    virtual bool
    clean () override;

    virtual string
    branch () override;

    virtual bool
    branch_exists (const string&) override;

    virtual string
    head () override;

    virtual optional<string>
    resolve (const string&) override;

    virtual bool
    ancestor (const string&, const string&) override;

    virtual string
    subject (const string&) override;

    virtual optional<string>
    parent (const string&) override;

    virtual bool
    commit_exists (const string&) override;

    virtual bool
    tag_exists (const string&) override;

    virtual optional<string>
    tag_target (const string&) override;

    virtual bool
    merging () override;

    virtual strings
    unmerged () override;

    virtual void
    checkout (const string&) override;

    virtual merge_outcome
    merge (const string&, const string&) override;

    virtual string
    commit (const string&, const strings&) override;

    virtual string
    tag (const string&, const string&, const string&) override;

    virtual void
    delete_tag (const string&) override;

    virtual void
    reset (const string&) override;

    virtual void
    abort_merge () override;

    virtual void
    restore (const strings&) override;

    virtual bool
    exists (const path&) override;

    virtual string
    read (const path&) override;

    virtual void
    write (const path&, const string&) override;

  private:
    dir_path root_;
    bool sign_off_;
    bool gpg_sign_;
  };
}

#endif // PREL_GIT_REPOSITORY_HXX
