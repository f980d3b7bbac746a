// file      : prel/machine.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef PREL_MACHINE_HXX
#define PREL_MACHINE_HXX

#include <prel/types.hxx>
#include <prel/utility.hxx>

#include <prel/attempt.hxx>
#include <prel/repository.hxx>
#include <prel/diagnostics.hxx> // failure

namespace prel
{
  enum class command
  {
    run,       // Default invocation.
    edit,
    continue_,
    abort,
    status
  };

  string
  to_string (command);

  inline ostream&
  operator<< (ostream& os, command c)
  {
    return os << to_string (c);
  }

  // Repository facts relevant to the attempt, gathered fresh before every
  // decision.
  //
  struct observations
  {
    bool clean = false;
    string branch;          // Current branch, empty if detached.
    string head;

    // Merge is in progress and whether it (or the recorded conflict paths)
    // still contains unresolved conflicts.
    //
    bool merging = false;
    bool conflicts = false;

    // HEAD is a merge of the source branch on top of the merge base, that
    // is, the merge has been committed.
    //
    bool source_merged = false;

    // Recorded commits still exist (true if not recorded).
    //
    bool merge_commit_exists = true;
    bool bump_commit_exists = true;

    // HEAD is the bump commit for the resolved version on top of the bump
    // base, that is, the bump has been committed.
    //
    bool bump_committed = false;

    // The commit the recorded tag points to, if the tag exists.
    //
    optional<string> tag_target;
  };

  // Gather the observations for the attempt. The bump subject is the bump
  // commit message subject for the resolved version, if already resolved.
  //
  observations
  observe (repository&, const release_attempt&, const string& bump_subject);

  // Return true if the file content contains conflict markers.
  //
  bool
  conflict_markers (const string& content);

  // What the engine should do next.
  //
  enum class action
  {
    none,           // Nothing to do (status, abort without attempt, etc).
    start,          // Check preconditions, create the record, and switch to
                    // the target branch.
    merge,          // Merge the source branch.
    adopt_merge,    // Record HEAD as the merge commit.
    wait_conflict,  // Record the conflicts and return control to the user.
    conclude_merge, // Commit the resolved merge.
    suspend,        // Pause for a custom commit.
    resume,         // Custom commit done.
    bump,           // Resolve (once) and write the version and commit.
    adopt_bump,     // Record HEAD as the bump commit.
    tag,            // Create the release tag.
    adopt_tag,      // Record the existing release tag.
    finish,         // Attempt completed.
    rollback        // Undo the completed steps.
  };

  string
  to_string (action);

  inline ostream&
  operator<< (ostream& os, action a)
  {
    return os << to_string (a);
  }

  // Phase transition. If error is present, then the command cannot proceed
  // in this state and the engine should fail with this failure kind and the
  // reason (and hint, if any) as diagnostics. In this case the phase stays
  // unchanged and the action is none.
  //
  // Note that the merge action transitions to ready-to-bump only if the
  // merge is clean. The engine transitions to merge-conflict otherwise.
  //
  struct transition
  {
    release_phase next;
    action act = action::none;

    optional<failure> error;
    string reason;
    string hint;
  };

  // The release state machine. Given the record (not-started phase if there
  // is no attempt in progress), the fresh observations, and the command,
  // decide what to do next. Has no side effects.
  //
  transition
  decide (const release_attempt&, const observations&, command);
}

#endif // PREL_MACHINE_HXX
