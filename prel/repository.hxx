// file      : prel/repository.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef PREL_REPOSITORY_HXX
#define PREL_REPOSITORY_HXX

#include <prel/types.hxx>
#include <prel/utility.hxx>

namespace prel
{
  // Outcome of a merge. A conflicted merge is a normal outcome and leaves
  // the merge in progress. Any other merge failure is an adapter failure.
  //
  struct merge_outcome
  {
    bool    conflicted = false;
    strings paths;     // Conflicting paths.
  };

  // Version control capabilities the release engine relies on.
  //
  // All the functions may fail by throwing failed with failure::adapter
  // (having issued diagnostics). Commits are identified by their full ids
  // and paths are relative to the working tree root.
  //
  class repository
  {
  public:
    virtual
    ~repository () = default;

    // Queries.
    //
    virtual bool
    clean () = 0;

    // Current branch or empty if HEAD is detached.
    //
    virtual string
    branch () = 0;

    virtual bool
    branch_exists (const string&) = 0;

    virtual string
    head () = 0;

    // Resolve a revision (branch, tag, commit id) to a commit id returning
    // nullopt if it cannot be resolved.
    //
    virtual optional<string>
    resolve (const string& rev) = 0;

    // Return true if commit a is an ancestor of (or the same as) commit d.
    //
    virtual bool
    ancestor (const string& a, const string& d) = 0;

    // Commit message subject (first line).
    //
    virtual string
    subject (const string& commit) = 0;

    // First parent or nullopt for a root commit.
    //
    virtual optional<string>
    parent (const string& commit) = 0;

    virtual bool
    commit_exists (const string& id) = 0;

    virtual bool
    tag_exists (const string& name) = 0;

    // The commit the tag points to or nullopt if there is no such tag.
    //
    virtual optional<string>
    tag_target (const string& name) = 0;

    // True if a merge is in progress (MERGE_HEAD is present).
    //
    virtual bool
    merging () = 0;

    // Paths with unresolved (unmerged) index entries.
    //
    virtual strings
    unmerged () = 0;

    // Mutations.
    //
    virtual void
    checkout (const string& branch) = 0;

    // Merge the source branch into the current branch always creating a
    // merge commit.
    //
    virtual merge_outcome
    merge (const string& source, const string& message) = 0;

    // Stage the specified paths and commit everything staged, concluding
    // the merge in progress, if any. Return the new commit id.
    //
    virtual string
    commit (const string& message, const strings& paths) = 0;

    // Create a tag pointing to the commit. If the message is empty, then
    // create a lightweight tag. Return the tag id.
    //
    virtual string
    tag (const string& name, const string& commit, const string& message) = 0;

    // Rollback primitives.
    //
    virtual void
    delete_tag (const string& name) = 0;

    // Reset the current branch, index, and working tree to the commit.
    //
    virtual void
    reset (const string& commit) = 0;

    virtual void
    abort_merge () = 0;

    // Restore the paths in the index and working tree from HEAD.
    //
    virtual void
    restore (const strings& paths) = 0;

    // Working tree file access.
    //
    virtual bool
    exists (const path&) = 0;

    virtual string
    read (const path&) = 0;

    virtual void
    write (const path&, const string&) = 0;
  };
}

#endif // PREL_REPOSITORY_HXX
