// file      : prel/attempt.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef PREL_ATTEMPT_HXX
#define PREL_ATTEMPT_HXX

#include <libbutl/manifest-parser.hxx>
#include <libbutl/manifest-serializer.hxx>

#include <prel/types.hxx>
#include <prel/utility.hxx>

#include <prel/options-types.hxx>

namespace prel
{
  // Release attempt phases in the order they are normally traversed.
  //
  // not-started -> merging -> merge-conflict -> awaiting-commit ->
  // ready-to-bump -> bumping -> bumped -> tagging -> completed
  //
  // With aborted reachable from every non-terminal phase. Note that the
  // enumerators are ordered and the relational operators are used to check
  // how far the attempt has advanced.
  //
  enum class release_phase
  {
    not_started,
    merging,
    merge_conflict,
    awaiting_commit,
    ready_to_bump,
    bumping,
    bumped,
    tagging,
    completed,
    aborted
  };

  string
  to_string (release_phase);

  release_phase
  to_release_phase (const string&); // May throw invalid_argument.

  inline ostream&
  operator<< (ostream& os, release_phase p)
  {
    return os << to_string (p);
  }

  inline bool
  terminal (release_phase p)
  {
    return p == release_phase::completed || p == release_phase::aborted;
  }

  // Rollback step recorded once the corresponding forward step completes.
  //
  enum class undo_kind
  {
    checkout, // Switch back to the branch (argument).
    merge,    // Reset to the pre-merge commit (argument).
    restore,  // Restore the path (argument) from HEAD.
    bump,     // Reset to the pre-bump commit (argument).
    tag       // Delete the tag (argument).
  };

  string
  to_string (undo_kind);

  undo_kind
  to_undo_kind (const string&); // May throw invalid_argument.

  struct undo_step
  {
    undo_kind kind;
    string argument;
  };

  inline bool
  operator== (const undo_step& x, const undo_step& y)
  {
    return x.kind == y.kind && x.argument == y.argument;
  }

  // The persisted release attempt record.
  //
  // The manifest has the following form (see the data members for the
  // value semantics):
  //
  // : 1
  // attempt: <uuid>
  // phase: <phase>
  // source-branch: <branch>
  // target-branch: <branch>
  // scheme: <scheme>
  // base-version: <version>
  // bump: <kind>
  // [resolved-version]: <version>
  // [original-branch]: <branch>
  // [merge-base]: <commit>
  // [merge-commit]: <commit>
  // [bump-base]: <commit>
  // [bump-commit]: <commit>
  // [tag]: <name>
  // [edit]: true
  // [conflict]: <path>
  // [undo]: <kind> <argument>
  // created: <time>
  // updated: <time>
  //
  // Where conflict and undo can be repeated and <time> is UTC in the
  // YYYY-MM-DDTHH:MM:SSZ form. Any other values are preserved as is.
  //
  class release_attempt
  {
  public:
    string id;
    release_phase phase = release_phase::not_started;

    string source_branch;
    string target_branch;

    version_scheme scheme = version_scheme::semver;
    string base_version;
    bump_kind bump = bump_kind::minor;

    // Set once on entering the bumping phase and never recomputed.
    //
    optional<string> resolved_version;

    // Branch that was checked out before we switched to the target branch.
    //
    optional<string> original_branch;

    optional<string> merge_base;   // Target branch tip before the merge.
    optional<string> merge_commit;
    optional<string> bump_base;    // HEAD the bump commit is made on.
    optional<string> bump_commit;
    optional<string> tag;

    // Pause before the bump for a custom commit.
    //
    bool edit = false;

    strings conflicts;

    // In the order the steps were completed.
    //
    vector<undo_step> undo;

    timestamp created = timestamp_unknown;
    timestamp updated = timestamp_unknown;

    vector<butl::manifest_name_value> unknown;

  public:
    release_attempt () = default;

    // Throw manifest_parsing on syntactic or semantic errors.
    //
    explicit
    release_attempt (butl::manifest_parser&);

    void
    serialize (butl::manifest_serializer&) const;
  };

  // Compare all the values including the unknown ones (by name and value).
  //
  bool
  operator== (const release_attempt&, const release_attempt&);

  inline bool
  operator!= (const release_attempt& x, const release_attempt& y)
  {
    return !(x == y);
  }

  // Current time truncated to the record's timestamp resolution.
  //
  timestamp
  now ();
}

#endif // PREL_ATTEMPT_HXX
