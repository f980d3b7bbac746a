// file      : prel/release.test.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <sstream>
#include <iostream>

#include <prel/types.hxx>
#include <prel/utility.hxx>

#include <prel/status.hxx>
#include <prel/release.hxx>
#include <prel/diagnostics.hxx>
#include <prel/state-store.hxx>
#include <prel/fake-repository.hxx>

#undef NDEBUG
#include <cassert>

using namespace std;
using namespace butl;

namespace prel
{
  static const string merge_subject ("Merge branch 'develop' into master");

  static options
  parse_options (const strings& args)
  {
    cli::vector_scanner s (args);

    options o;
    o.parse (s);
    return o;
  }

  // Repository with the master and develop branches where develop has one
  // commit on top of master that changes a.c and b.c. The record is stored
  // in its own subdirectory of the test directory.
  //
  struct fixture
  {
    fake_repository repo;
    state_store store;

    string init;    // Root commit.
    string feature; // Develop tip.

    fixture (const dir_path& d, const string& version = "1.4.0\n")
        : store (d / prel_dir)
    {
      init = repo.init ("master", {{"VERSION", version},
                                   {"a.c", "int a;\n"},
                                   {"b.c", "int b;\n"}});

      repo.create_branch ("develop", init);

      feature = repo.commit_to ("develop",
                                "Add feature",
                                {{"a.c", "int a = 1;\n"},
                                 {"b.c", "int b = 1;\n"}});
    }

    // Run the command with the default options followed by the extra ones
    // returning the exit code.
    //
    int
    release (command c, const strings& extra = strings ())
    {
      strings a {"--source-branch", "develop",
                 "--target-branch", "master",
                 "--version-file",  "VERSION"};

      a.insert (a.end (), extra.begin (), extra.end ());

      try
      {
        return cmd_release (parse_options (a), c, repo, store);
      }
      catch (const failed& e)
      {
        return exit_code (e.kind);
      }
    }

    int
    status (string& out, const strings& args = strings ())
    {
      ostringstream os;
      int r (cmd_status (parse_options (args), repo, store, os));
      out = os.str ();
      return r;
    }

    release_attempt
    record () const
    {
      optional<release_attempt> a (store.load ());
      assert (a);
      return move (*a);
    }

    bool
    has_record () const
    {
      return store.load () != nullopt;
    }

    // Check the release is complete: one merge and one bump commit on
    // master with the tag pointing to the latter, and no record.
    //
    void
    released (const string& version, const string& tag = string ())
    {
      string t (tag.empty () ? "v" + version : tag);

      assert (repo.branch () == "master");
      assert (repo.clean ());
      assert (!has_record ());

      assert (repo.count (merge_subject) == 1);
      assert (repo.count ("Release version " + version) == 1);

      string h (repo.head ());
      assert (repo.subject (h) == "Release version " + version);
      assert (repo.files (h).at ("VERSION") == version + '\n');
      assert (repo.files (h).at ("a.c") == "int a = 1;\n");

      assert (repo.tags.size () == 1);
      assert (repo.tag_target (t) && *repo.tag_target (t) == h);

      // The merge commit is the bump commit parent.
      //
      const strings& ps (repo.commits.at (*repo.parent (h)).parents);
      assert (ps.size () == 2 && ps[0] == init && ps[1] == feature);
    }

    // Check that the status report (in both formats, twice) changes
    // neither the repository nor the record.
    //
    void
    status_only ()
    {
      optional<release_attempt> a (store.load ());
      map<string, string> bs (repo.branches);
      fake_repository::tree w (repo.work);
      size_t cs (repo.commits.size ());
      size_t ts (repo.tags.size ());
      bool m (repo.merging ());

      for (size_t i (0); i != 2; ++i)
      {
        string s;
        status (s);
        status (s, {"--stdout-format", "json"});

        optional<release_attempt> l (store.load ());
        assert (l.has_value () == a.has_value ());
        assert (!l || *l == *a);

        assert (repo.branches == bs);
        assert (repo.work == w);
        assert (repo.commits.size () == cs);
        assert (repo.tags.size () == ts);
        assert (repo.merging () == m);
      }
    }

    // Check the release attempt left no trace.
    //
    void
    rolled_back ()
    {
      assert (repo.branch () == "master");
      assert (repo.head () == init);
      assert (repo.clean ());
      assert (!repo.merging ());
      assert (repo.tags.empty ());
      assert (!has_record ());
    }
  };

  int
  main ()
  {
    using phase = release_phase;

    const command run (command::run);
    const command edit (command::edit);
    const command cont (command::continue_);
    const command abort_ (command::abort);

    dir_path td (dir_path::temp_path ("prel-release"));
    auto_rmdir rm (td);

    size_t n (0);
    auto next_dir = [&td, &n] () {return td / dir_path (to_string (++n));};

    // Basics.
    //
    {
      fixture f (next_dir ());

      assert (f.release (run) == exit_success);
      f.released ("1.5.0");

      const fake_repository::tag_info& t (f.repo.tags.at ("v1.5.0"));
      assert (t.message == "Tag version 1.5.0");

      // Nothing left to release.
      //
      size_t cs (f.repo.commits.size ());
      assert (f.release (run) == exit_state);
      assert (f.repo.commits.size () == cs);
      assert (!f.has_record ());
    }

    // Formats, schemes, and lightweight tag.
    //
    {
      fixture f (next_dir (), "1.4\n");

      assert (f.release (run, {"--scheme", "pep440",
                               "--bump", "post",
                               "--tag-format", "release-{version}",
                               "--no-annotate"}) == exit_success);

      f.released ("1.4.post1", "release-1.4.post1");
      assert (f.repo.tags.at ("release-1.4.post1").message.empty ());
    }

    // Merge conflict.
    //
    {
      fixture f (next_dir ());
      f.repo.conflict_on_merge ({"a.c", "b.c"});

      assert (f.release (run) == exit_conflict);

      release_attempt a (f.record ());
      assert (a.phase == phase::merge_conflict);
      assert (a.conflicts == (strings {"a.c", "b.c"}));
      assert (f.repo.merging ());

      // The report lists both paths.
      //
      string s;
      assert (f.status (s) == exit_in_progress);
      assert (s.find ("phase:    merge-conflict") != string::npos);
      assert (s.find ("conflict: a.c\n") != string::npos);
      assert (s.find ("conflict: b.c\n") != string::npos);
      assert (s.find ("problem:") != string::npos);

      assert (f.status (s, {"--stdout-format", "json"}) == exit_in_progress);
      assert (s.find ("\"merge-conflict\"") != string::npos);
      assert (s.find ("\"b.c\"") != string::npos);

      // Refused while any conflict remains and nothing changes.
      //
      assert (f.release (cont) == exit_conflict);
      assert (f.record () == a);

      f.repo.resolve_conflict ("a.c", "int a = 2;\n");
      assert (f.release (cont) == exit_conflict);
      assert (f.release (run) == exit_conflict);
      assert (f.record () == a);

      // Resolved but markers left in the file.
      //
      f.repo.resolve_conflict ("b.c",
                               "<<<<<<< HEAD\nint b;\n=======\n"
                               "int b = 1;\n>>>>>>> develop\n");
      assert (f.release (cont) == exit_conflict);

      // Resolved, the default run is not enough.
      //
      f.repo.resolve_conflict ("b.c", "int b = 2;\n");
      assert (f.release (run) == exit_state);
      assert (f.record () == a);

      assert (f.release (cont) == exit_success);
      assert (!f.has_record ());
      assert (f.repo.count (merge_subject) == 1);
      assert (f.repo.files (f.repo.head ()).at ("a.c") == "int a = 2;\n");
      assert (f.repo.tag_target ("v1.5.0"));
    }

    // Custom commit before the bump.
    //
    {
      fixture f (next_dir ());

      assert (f.release (edit) == exit_success);

      release_attempt a (f.record ());
      assert (a.phase == phase::awaiting_commit && !a.edit);
      assert (a.merge_commit && f.repo.head () == *a.merge_commit);
      assert (f.repo.tags.empty ());

      string c (f.repo.commit_to ("master",
                                  "Update changelog",
                                  {{"NEWS", "Version 1.5.0\n"}}));

      assert (f.release (run) == exit_state);
      assert (f.release (cont) == exit_success);

      string h (f.repo.head ());
      assert (*f.repo.parent (h) == c);
      assert (f.repo.subject (h) == "Release version 1.5.0");
      assert (f.repo.files (h).at ("NEWS") == "Version 1.5.0\n");
      assert (*f.repo.tag_target ("v1.5.0") == h);
      assert (!f.has_record ());
    }

    // Edit requested on an attempt stopped at the merge conflict.
    //
    {
      fixture f (next_dir ());
      f.repo.conflict_on_merge ({"a.c"});

      assert (f.release (run) == exit_conflict);
      assert (f.release (edit) == exit_success);
      assert (f.record ().edit);

      f.repo.resolve_conflict ("a.c", "int a = 1;\n");
      assert (f.release (cont) == exit_success);
      assert (f.record ().phase == phase::awaiting_commit);

      assert (f.release (cont) == exit_success);
      assert (!f.has_record ());
    }

    // Crash after each mutating step and resume.
    //
    for (const char* op: {"merge", "commit", "write", "tag"})
    {
      fixture f (next_dir ());
      f.repo.crash_after (op);

      try
      {
        f.release (run);
        assert (false);
      }
      catch (const simulated_crash&) {}

      assert (f.has_record ());

      string s;
      assert (f.status (s) == exit_in_progress);

      assert (f.release (run) == exit_success);
      f.released ("1.5.0");
    }

    // Crash while checking out the original branch: the attempt is not
    // started yet and the next run starts over.
    //
    {
      fixture f (next_dir ());
      f.repo.checkout ("develop");
      f.repo.crash_after ("checkout");

      try
      {
        f.release (run);
        assert (false);
      }
      catch (const simulated_crash&) {}

      assert (!f.has_record ());
      assert (f.repo.branch () == "master");

      assert (f.release (run) == exit_success);
      f.released ("1.5.0");
    }

    // Abort from every phase.
    //
    {
      // Merge conflict.
      //
      {
        fixture f (next_dir ());
        f.repo.conflict_on_merge ({"a.c"});

        assert (f.release (run) == exit_conflict);
        assert (f.release (abort_) == exit_success);
        f.rolled_back ();
      }

      // Awaiting commit, including the custom commit.
      //
      {
        fixture f (next_dir ());

        assert (f.release (edit) == exit_success);
        f.repo.commit_to ("master", "Update changelog", {{"NEWS", "1.5\n"}});

        assert (f.release (abort_) == exit_success);
        f.rolled_back ();
        assert (f.repo.work.find ("NEWS") == f.repo.work.end ());
      }

      // Bumping, tagging, and completed but not recorded as such.
      //
      for (const char* op: {"write", "commit", "tag"})
      {
        fixture f (next_dir ());
        f.repo.crash_after (op);

        try
        {
          f.release (run);
          assert (false);
        }
        catch (const simulated_crash&) {}

        assert (f.release (abort_) == exit_success);
        f.rolled_back ();
        assert (f.repo.files (f.repo.head ()).at ("VERSION") == "1.4.0\n");
      }

      // Back to the original branch.
      //
      {
        fixture f (next_dir ());
        f.repo.create_branch ("topic", f.init);
        f.repo.checkout ("topic");
        f.repo.conflict_on_merge ({"b.c"});

        assert (f.release (run) == exit_conflict);
        assert (f.repo.branch () == "master");

        assert (f.release (abort_) == exit_success);
        assert (f.repo.branch () == "topic");
        assert (f.repo.clean () && !f.has_record ());
      }

      // Paused, then work committed on another branch. Only the target
      // branch is rolled back and we end up where we were.
      //
      {
        fixture f (next_dir ());

        assert (f.release (edit) == exit_success);
        string mc (*f.record ().merge_commit);

        f.repo.create_branch ("topic", f.init);
        f.repo.checkout ("topic");
        string t (f.repo.commit_to ("topic", "Work", {{"w.c", "int w;\n"}}));

        assert (f.release (abort_) == exit_success);
        assert (!f.has_record ());
        assert (f.repo.branch () == "topic" && f.repo.head () == t);
        assert (*f.repo.resolve ("master") == f.init);
        assert (f.repo.commit_exists (mc));
      }

      // Same but with uncommitted changes: nothing is reset and the
      // rollback is reported as incomplete.
      //
      {
        fixture f (next_dir ());

        assert (f.release (edit) == exit_success);
        string mc (*f.record ().merge_commit);

        f.repo.create_branch ("topic", f.init);
        f.repo.checkout ("topic");
        string t (f.repo.commit_to ("topic", "Work", {{"w.c", "int w;\n"}}));
        f.repo.work["w.c"] = "int w = 1;\n";

        assert (f.release (abort_) == exit_internal);
        assert (!f.has_record ());
        assert (f.repo.branch () == "topic" && f.repo.head () == t);
        assert (f.repo.work.at ("w.c") == "int w = 1;\n");
        assert (*f.repo.resolve ("master") == mc);
      }

      // A commit on top of the bump is not ours.
      //
      {
        fixture f (next_dir ());
        f.repo.crash_after ("tag");

        try
        {
          f.release (run);
          assert (false);
        }
        catch (const simulated_crash&) {}

        string h (f.repo.commit_to ("master", "Hotfix", {{"c.c", "c\n"}}));

        assert (f.release (abort_) == exit_internal);
        assert (f.repo.head () == h && f.repo.tags.empty ());
      }

      // Nothing to abort.
      //
      {
        fixture f (next_dir ());
        assert (f.release (abort_) == exit_success);
        assert (f.repo.commits.size () == 2);
      }

      // Keep the record for audit. It doesn't block the next attempt.
      //
      {
        fixture f (next_dir ());
        f.repo.conflict_on_merge ({"a.c"});

        assert (f.release (run) == exit_conflict);
        string id (f.record ().id);

        assert (f.release (abort_, {"--keep-record"}) == exit_success);

        release_attempt a (f.record ());
        assert (a.phase == phase::aborted && a.id == id);

        string s;
        assert (f.status (s) == exit_success);
        assert (s == "no release in progress\n"
                     "last attempt " + id + " aborted\n");

        assert (f.release (run, {"--keep-record"}) == exit_success);

        a = f.record ();
        assert (a.phase == phase::completed && a.id != id);
        assert (a.resolved_version && *a.resolved_version == "1.5.0");
      }
    }

    // Rollback step failure is reported and the record discarded.
    //
    {
      fixture f (next_dir ());
      f.repo.crash_after ("tag");

      try
      {
        f.release (run);
        assert (false);
      }
      catch (const simulated_crash&) {}

      f.repo.fail_on ("reset");

      assert (f.release (abort_) == exit_internal);
      assert (!f.has_record ());
      assert (f.repo.tags.empty ());
    }

    // Adapter failure during the bump falls back to ready-to-bump keeping
    // the resolved version.
    //
    for (const char* op: {"write", "commit"})
    {
      fixture f (next_dir ());
      f.repo.fail_on (op);

      assert (f.release (run) == exit_internal);

      release_attempt a (f.record ());
      assert (a.phase == phase::ready_to_bump);
      assert (a.resolved_version && *a.resolved_version == "1.5.0");
      assert (a.tag && *a.tag == "v1.5.0");
      assert (f.repo.clean ());

      // The version is not recomputed even if the options change.
      //
      assert (f.release (run, {"--bump", "major"}) == exit_success);
      f.released ("1.5.0");
    }

    // Status has no side effects.
    //
    {
      fixture f (next_dir ());

      string s;
      assert (f.status (s) == exit_success);
      assert (s == "no release in progress\n");

      assert (f.status (s, {"--stdout-format", "json"}) == exit_success);
      assert (s.find ("\"in_progress\"") != string::npos);
      assert (s.find ("false") != string::npos);

      assert (f.release (edit) == exit_success);

      release_attempt a (f.record ());
      map<string, string> bs (f.repo.branches);
      fake_repository::tree w (f.repo.work);
      size_t cs (f.repo.commits.size ());

      for (size_t i (0); i != 2; ++i)
      {
        assert (f.status (s) == exit_in_progress);
        assert (s.find ("release attempt " + a.id) != string::npos);
        assert (s.find ("phase:    awaiting-commit") != string::npos);
        assert (s.find ("next: ") != string::npos);
      }

      assert (f.record () == a);
      assert (f.repo.branches == bs);
      assert (f.repo.work == w);
      assert (f.repo.commits.size () == cs);
      assert (f.repo.tags.empty ());
    }

    // Status has no side effects in any phase.
    //
    {
      fixture f (next_dir ());
      f.status_only ();

      auto crash = [&f, &run] (const char* op)
      {
        f.repo.crash_after (op);

        try
        {
          f.release (run);
          assert (false);
        }
        catch (const simulated_crash&) {}
      };

      f.repo.conflict_on_merge ({"a.c"});
      assert (f.release (run) == exit_conflict);
      f.status_only ();

      assert (f.release (edit) == exit_success);
      f.repo.resolve_conflict ("a.c", "int a = 1;\n");
      assert (f.release (cont) == exit_success);
      assert (f.record ().phase == phase::awaiting_commit);
      f.status_only ();

      f.repo.fail_on ("commit");
      assert (f.release (cont) == exit_internal);
      assert (f.record ().phase == phase::ready_to_bump);
      f.status_only ();

      crash ("write");
      assert (f.record ().phase == phase::bumping);
      f.status_only ();

      crash ("tag");
      assert (f.record ().phase == phase::tagging);
      f.status_only ();

      assert (f.release (run, {"--keep-record"}) == exit_success);
      assert (f.record ().phase == phase::completed);
      f.status_only ();
    }

    // Refused starts leave nothing behind.
    //
    {
      // Continue without an attempt.
      //
      {
        fixture f (next_dir ());
        assert (f.release (cont) == exit_state);
        assert (!f.has_record () && f.repo.commits.size () == 2);
      }

      // Dirty working tree.
      //
      {
        fixture f (next_dir ());
        f.repo.work["a.c"] = "int a = 3;\n";
        assert (f.release (run) == exit_state);
        assert (!f.has_record ());
      }

      // Missing branch.
      //
      {
        fixture f (next_dir ());
        assert (f.release (run, {"--source-branch", "dev"}) == exit_state);
        assert (!f.has_record ());
      }

      // Same branches.
      //
      {
        fixture f (next_dir ());
        assert (f.release (run, {"--source-branch", "master"}) ==
                exit_config);
      }

      // Invalid format.
      //
      {
        fixture f (next_dir ());
        assert (f.release (run, {"--tag-format", "v{ver}"}) == exit_config);
        assert (!f.has_record ());
      }

      // Invalid version switches back to the original branch.
      //
      {
        fixture f (next_dir (), "1.4\n");
        f.repo.create_branch ("topic", f.init);
        f.repo.checkout ("topic");

        assert (f.release (run) == exit_version);
        assert (f.repo.branch () == "topic");
        assert (!f.has_record ());

        // Bump not applicable under the scheme.
        //
        f.repo.commit_to ("topic", "Fix version", {{"VERSION", "1.4.0\n"}});
        f.repo.checkout ("master");
        f.repo.commit_to ("master", "Fix version", {{"VERSION", "1.4.0\n"}});

        assert (f.release (run, {"--bump", "post"}) == exit_version);
        assert (!f.has_record ());
      }
    }

    // Target branch moved while the attempt is in progress.
    //
    {
      fixture f (next_dir ());
      f.repo.conflict_on_merge ({"a.c"});

      assert (f.release (run) == exit_conflict);
      f.repo.abort_merge ();
      string h (f.repo.commit_to ("master", "Hotfix", {{"c.c", "int c;\n"}}));

      assert (f.release (cont) == exit_state);
      assert (f.record ().phase == phase::merge_conflict);

      // The commit is not ours so it stays and the rollback is reported
      // as incomplete.
      //
      assert (f.release (abort_) == exit_internal);
      assert (!f.has_record ());
      assert (f.repo.branch () == "master" && f.repo.head () == h);
      assert (f.repo.work.at ("c.c") == "int c;\n");
    }

    return 0;
  }
}

int
main ()
{
  return prel::main ();
}
