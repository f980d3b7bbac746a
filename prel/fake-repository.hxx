// file      : prel/fake-repository.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef PREL_FAKE_REPOSITORY_HXX
#define PREL_FAKE_REPOSITORY_HXX

#include <prel/types.hxx>
#include <prel/utility.hxx>

#include <prel/repository.hxx>

namespace prel
{
  // Thrown by fake_repository after performing an operation to simulate the
  // process being killed. Deliberately not derived from std::exception.
  //
  struct simulated_crash {};

  // In-memory repository for testing the release engine.
  //
  // The working tree and the index are the same thing (so everything
  // written is staged) and commit ids are c1, c2, etc. A conflicting merge
  // and failures of the mutating operations can be requested in advance.
  //
  class fake_repository: public repository
  {
  public:
    using tree = map<string, string>; // Path to content.

    struct commit_info
    {
      strings parents;
      string subject;
      tree files;
    };

    struct tag_info
    {
      string commit;
      string message; // Empty for lightweight.
    };

    // Setup.
    //
    // Create the root commit on the branch and check it out.
    //
    string
    init (const string& branch, tree files, const string& subject = "Init");

    // Create the branch pointing to the commit.
    //
    void
    create_branch (const string& branch, const string& commit);

    // Commit the changed files on top of the branch tip without checking
    // it out.
    //
    string
    commit_to (const string& branch, const string& subject, const tree&);

    // Make the next merge conflict on the specified paths.
    //
    void
    conflict_on_merge (strings paths) {conflict_paths_ = move (paths);}

    // Write the resolved content and mark the path as resolved.
    //
    void
    resolve_conflict (const string& path, const string& content);

    // Make the next call to the operation (merge, commit, tag, checkout,
    // reset, abort_merge, delete_tag, restore, write) fail with an adapter
    // failure.
    //
    void
    fail_on (const string& op) {fail_ = op;}

    // Make the next call to the operation throw simulated_crash after it
    // has been performed.
    //
    void
    crash_after (const string& op) {crash_ = op;}

    // Number of commits with the subject.
    //
    size_t
    count (const string& subject) const;

    const tree&
    files (const string& commit) const;

    // Repository interface.
    //
  public:
    virtual bool
    clean () override;

    virtual string
    branch () override {return current;}

    virtual bool
    branch_exists (const string& b) override
    {
      return branches.find (b) != branches.end ();
    }

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
    commit_exists (const string& id) override
    {
      return commits.find (id) != commits.end ();
    }

    virtual bool
    tag_exists (const string& n) override
    {
      return tags.find (n) != tags.end ();
    }

    virtual optional<string>
    tag_target (const string&) override;

    virtual bool
    merging () override {return merge_head != nullopt;}

    virtual strings
    unmerged () override {return unmerged_paths;}

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
    exists (const path& p) override
    {
      return work.find (p.string ()) != work.end ();
    }

    virtual string
    read (const path&) override;

    virtual void
    write (const path&, const string&) override;

  public:
    map<string, commit_info> commits;
    map<string, string> branches;     // Branch to tip commit.
    map<string, tag_info> tags;

    string current;                   // Empty if detached.
    string detached;                  // HEAD commit if detached.

    tree work;

    optional<string> merge_head;
    strings unmerged_paths;

  private:
    string
    add_commit (strings parents, string subject, tree);

    void
    move_head (const string& commit);

    void
    check (const char* op);

    void
    done (const char* op);

  private:
    strings conflict_paths_;
    string fail_;
    string crash_;
  };
}

#endif // PREL_FAKE_REPOSITORY_HXX
