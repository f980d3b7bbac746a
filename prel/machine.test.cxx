// file      : prel/machine.test.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <iostream>

#include <prel/types.hxx>
#include <prel/utility.hxx>

#include <prel/machine.hxx>
#include <prel/fake-repository.hxx>

#undef NDEBUG
#include <cassert>

using namespace std;

namespace prel
{
  using phase = release_phase;

  // Return true if the transition is to the phase with the action.
  //
  static bool
  to (const transition& t, phase p, action a)
  {
    return !t.error && t.next == p && t.act == a;
  }

  // Return true if the transition is an error of the kind that keeps the
  // phase.
  //
  static bool
  refused (const transition& t, const release_attempt& a, failure f)
  {
    return t.error && *t.error == f && t.next == a.phase &&
           t.act == action::none && !t.reason.empty ();
  }

  // Observations consistent with the attempt in its phase.
  //
  static observations
  consistent (const release_attempt& a)
  {
    observations o;
    o.clean = true;
    o.branch = a.target_branch;

    switch (a.phase)
    {
    case phase::merging:
      o.head = *a.merge_base;
      break;
    case phase::merge_conflict:
      o.head = *a.merge_base;
      o.merging = true;
      break;
    case phase::awaiting_commit:
    case phase::ready_to_bump:
      o.head = *a.merge_commit;
      break;
    case phase::bumping:
      o.head = *a.bump_base;
      break;
    default:
      o.head = a.bump_commit ? *a.bump_commit : string ("c1");
    }

    return o;
  }

  static release_attempt
  attempt (phase p)
  {
    release_attempt a;
    a.id = "a1";
    a.phase = p;
    a.source_branch = "develop";
    a.target_branch = "master";
    a.base_version = "1.4.0";

    if (p >= phase::merging)
      a.merge_base = "c1";

    if (p >= phase::awaiting_commit)
      a.merge_commit = "c3";

    if (p >= phase::bumping)
    {
      a.resolved_version = "1.5.0";
      a.tag = "v1.5.0";
      a.bump_base = "c3";
    }

    if (p >= phase::bumped)
      a.bump_commit = "c4";

    return a;
  }

  int
  main ()
  {
    const command run (command::run);
    const command edit (command::edit);
    const command cont (command::continue_);
    const command abort_ (command::abort);
    const command status (command::status);

    // Conflict markers.
    //
    {
      assert (conflict_markers ("<<<<<<< HEAD\na\n=======\nb\n>>>>>>> x\n"));
      assert (conflict_markers ("a\r\n=======\r\nb\r\n"));
      assert (conflict_markers ("x\n||||||| base\ny\n"));
      assert (conflict_markers (">>>>>>>"));

      assert (!conflict_markers (""));
      assert (!conflict_markers ("1.5.0\n"));
      assert (!conflict_markers ("========\n"));
      assert (!conflict_markers ("<<<<<<<<\n"));
      assert (!conflict_markers ("a <<<<<<< b\n"));
      assert (!conflict_markers ("Title\n=====\n"));
    }

    // Not started.
    //
    {
      release_attempt a;
      observations o;

      assert (to (decide (a, o, run), phase::merging, action::start));
      assert (to (decide (a, o, edit), phase::merging, action::start));
      assert (to (decide (a, o, abort_), phase::not_started, action::none));
      assert (to (decide (a, o, status), phase::not_started, action::none));
      assert (refused (decide (a, o, cont), a, failure::state));
    }

    // Terminal phases.
    //
    {
      release_attempt c (attempt (phase::completed));
      assert (to (decide (c, observations (), run),
                  phase::completed,
                  action::finish));

      release_attempt x (attempt (phase::aborted));
      assert (to (decide (x, observations (), run),
                  phase::aborted,
                  action::none));
      assert (to (decide (x, observations (), abort_),
                  phase::aborted,
                  action::none));
    }

    // Status never acts and abort always rolls back.
    //
    for (phase p: {phase::merging,
                   phase::merge_conflict,
                   phase::awaiting_commit,
                   phase::ready_to_bump,
                   phase::bumping,
                   phase::bumped,
                   phase::tagging})
    {
      release_attempt a (attempt (p));
      observations o (consistent (a));

      assert (to (decide (a, o, status), p, action::none));
      assert (to (decide (a, o, abort_), phase::aborted, action::rollback));

      // Even if the repository no longer matches the record.
      //
      o.branch = "feature";
      o.clean = false;
      assert (to (decide (a, o, abort_), phase::aborted, action::rollback));

      // But nothing else.
      //
      for (command c: {run, edit, cont})
      {
        transition t (decide (a, o, c));
        assert (refused (t, a, failure::state));
        assert (t.hint.find ("--abort") != string::npos);
      }
    }

    // Merging.
    //
    {
      release_attempt a (attempt (phase::merging));
      observations o (consistent (a));

      assert (to (decide (a, o, run), phase::ready_to_bump, action::merge));
      assert (to (decide (a, o, edit), phase::ready_to_bump, action::merge));

      // Interrupted after the conflicting merge was started.
      //
      o.merging = true;
      o.conflicts = true;
      assert (to (decide (a, o, run),
                  phase::merge_conflict,
                  action::wait_conflict));

      o.conflicts = false;
      assert (to (decide (a, o, run),
                  phase::ready_to_bump,
                  action::conclude_merge));

      // Interrupted after the merge commit was made.
      //
      o = consistent (a);
      o.head = "c3";
      o.source_merged = true;
      assert (to (decide (a, o, run),
                  phase::ready_to_bump,
                  action::adopt_merge));

      // Target branch moved by someone else.
      //
      o.source_merged = false;
      assert (refused (decide (a, o, run), a, failure::state));

      o = consistent (a);
      o.clean = false;
      assert (refused (decide (a, o, run), a, failure::state));
    }

    // Merge conflict.
    //
    {
      release_attempt a (attempt (phase::merge_conflict));
      a.conflicts = {"VERSION", "src/a.c"};

      observations o (consistent (a));
      o.conflicts = true;

      // Continue is refused while the conflicts remain and nothing moves.
      //
      for (command c: {run, cont})
        assert (refused (decide (a, o, c), a, failure::conflict));

      assert (to (decide (a, o, edit),
                  phase::merge_conflict,
                  action::suspend));

      o.conflicts = false;
      assert (to (decide (a, o, cont),
                  phase::ready_to_bump,
                  action::conclude_merge));
      assert (refused (decide (a, o, run), a, failure::state));

      // The user concluded the merge themselves.
      //
      o.merging = false;
      o.head = "c3";
      o.source_merged = true;
      assert (to (decide (a, o, cont),
                  phase::ready_to_bump,
                  action::adopt_merge));

      o.clean = false;
      assert (refused (decide (a, o, cont), a, failure::state));

      // The user aborted the merge themselves.
      //
      o = consistent (a);
      o.merging = false;
      assert (refused (decide (a, o, cont), a, failure::state));
    }

    // Awaiting commit.
    //
    {
      release_attempt a (attempt (phase::awaiting_commit));
      observations o (consistent (a));
      o.head = "c5"; // The custom commit.

      assert (to (decide (a, o, cont), phase::ready_to_bump, action::resume));
      assert (to (decide (a, o, edit), phase::awaiting_commit, action::none));
      assert (refused (decide (a, o, run), a, failure::state));

      o.clean = false;
      assert (refused (decide (a, o, cont), a, failure::state));
    }

    // Ready to bump.
    //
    {
      release_attempt a (attempt (phase::ready_to_bump));
      observations o (consistent (a));

      assert (to (decide (a, o, run), phase::bumped, action::bump));
      assert (to (decide (a, o, cont), phase::bumped, action::bump));
      assert (to (decide (a, o, edit),
                  phase::awaiting_commit,
                  action::suspend));

      a.edit = true;
      assert (to (decide (a, o, run),
                  phase::awaiting_commit,
                  action::suspend));
      a.edit = false;

      o.clean = false;
      assert (refused (decide (a, o, run), a, failure::state));
    }

    // Bumping.
    //
    {
      release_attempt a (attempt (phase::bumping));
      observations o (consistent (a));

      // Version files may be half-written.
      //
      o.clean = false;
      assert (to (decide (a, o, run), phase::bumped, action::bump));

      o.head = "c4";
      o.bump_committed = true;
      assert (to (decide (a, o, run), phase::bumped, action::adopt_bump));

      o.bump_committed = false;
      assert (refused (decide (a, o, run), a, failure::state));

      o = consistent (a);
      assert (refused (decide (a, o, edit), a, failure::state));
    }

    // Bumped and tagging.
    //
    for (phase p: {phase::bumped, phase::tagging})
    {
      release_attempt a (attempt (p));
      observations o (consistent (a));

      assert (to (decide (a, o, run), phase::completed, action::tag));

      o.tag_target = "c4";
      assert (to (decide (a, o, run), phase::completed, action::adopt_tag));

      o.tag_target = "c2";
      assert (refused (decide (a, o, run), a, failure::state));

      o = consistent (a);
      assert (refused (decide (a, o, edit), a, failure::state));

      o.bump_commit_exists = false;
      assert (refused (decide (a, o, run), a, failure::state));
    }

    // Record and repository mismatch.
    //
    {
      release_attempt a (attempt (phase::ready_to_bump));
      observations o (consistent (a));

      o.branch.clear (); // Detached.
      transition t (decide (a, o, run));
      assert (refused (t, a, failure::state));
      assert (t.reason.find ("detached") != string::npos);

      o = consistent (a);
      o.merge_commit_exists = false;
      assert (refused (decide (a, o, run), a, failure::state));
    }

    // Observations.
    //
    {
      fake_repository r;
      string c1 (r.init ("master", {{"VERSION", "1.4.0\n"}}));
      r.create_branch ("develop", c1);
      r.commit_to ("develop", "Add feature", {{"a.c", "int a;\n"}});

      release_attempt a (attempt (phase::merging));
      a.merge_base = c1;

      observations o (observe (r, a, ""));
      assert (o.clean && o.branch == "master" && o.head == c1);
      assert (!o.merging && !o.conflicts && !o.source_merged);

      // Merged.
      //
      r.merge ("develop", "Merge");
      o = observe (r, a, "");
      assert (o.source_merged && o.head != c1);

      // Conflict markers left in a path after the unmerged entries are
      // gone.
      //
      r.reset (c1);
      r.conflict_on_merge ({"VERSION"});
      r.commit_to ("develop", "Bump", {{"VERSION", "2.0.0\n"}});
      r.merge ("develop", "Merge");

      a.phase = phase::merge_conflict;
      a.conflicts = {"VERSION"};

      o = observe (r, a, "");
      assert (o.merging && o.conflicts);

      r.unmerged_paths.clear ();
      assert (observe (r, a, "").conflicts);

      r.resolve_conflict ("VERSION", "1.4.0\n");
      assert (!observe (r, a, "").conflicts);

      // A recorded path deleted during the resolution.
      //
      r.work.erase ("VERSION");
      assert (!observe (r, a, "").conflicts);

      // Nothing is observed without an attempt in progress.
      //
      o = observe (r, release_attempt (), "");
      assert (!o.clean && o.head.empty ());
    }

    return 0;
  }
}

int
main ()
{
  return prel::main ();
}
