// file      : prel/release.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <prel/release.hxx>

#include <chrono>

#include <prel/resolver.hxx>
#include <prel/diagnostics.hxx>
#include <prel/version-file.hxx>

using namespace std;
using namespace butl;

namespace prel
{
  static string
  format (const string& f, const substitutions& vs, const char* what)
  {
    try
    {
      return substitute (f, vs);
    }
    catch (const invalid_argument& e)
    {
      fail_config << "invalid " << what << " value '" << f << "': " << e
                  << endf;
    }
  }

  string
  merge_message (const options& o, const string& s, const string& t)
  {
    return format (o.merge_message (),
                   substitutions {{"source", s}, {"target", t}},
                   "--merge-message");
  }

  string
  bump_message (const options& o, const string& v)
  {
    return format (o.commit_message (),
                   substitutions {{"version", v}},
                   "--commit-message");
  }

  string
  bump_subject (const options& o, const string& v)
  {
    string r (bump_message (o, v));

    size_t p (r.find ('\n'));
    if (p != string::npos)
      r.resize (p);

    trim (r);
    return r;
  }

  string
  tag_name (const options& o, const string& v)
  {
    return format (o.tag_format (),
                   substitutions {{"version", v}},
                   "--tag-format");
  }

  string
  tag_message (const options& o, const string& v)
  {
    return format (o.tag_message (),
                   substitutions {{"version", v}},
                   "--tag-message");
  }

  namespace
  {
    struct context
    {
      const options& opts;
      repository& repo;
      state_store& store;
      version_files files;
    };
  }

  static void
  save (context& ctx, release_attempt& a)
  {
    a.updated = now ();
    ctx.store.save (a);
  }

  static void
  push_undo (release_attempt& a, undo_kind k, const string& arg)
  {
    undo_step s {k, arg};

    if (find (a.undo.begin (), a.undo.end (), s) == a.undo.end ())
      a.undo.push_back (move (s));
  }

  // Map the version errors to the version failures.
  //
  static string
  resolve_version (version_scheme s, const string& v, bump_kind k)
  {
    try
    {
      return resolve (s, v, k);
    }
    catch (const version_error& e)
    {
      fail_version << "unable to bump version " << v << ": " << e.what () <<
        info << "scheme " << s << ", bump " << k << endf;
    }
  }

  [[noreturn]] static void
  report_conflicts (const release_attempt& a)
  {
    diag_record dr (fail_conflict);

    dr << "merge of '" << a.source_branch << "' into '" << a.target_branch
       << "' has conflicts";

    for (const string& p: a.conflicts)
      dr << info << "conflict: " << p;

    dr << info << "resolve the conflicts and run 'prel --continue'" << endf;
  }

  [[noreturn]] static void
  report (const release_attempt& a, const transition& t)
  {
    diag_record dr;

    switch (*t.error)
    {
    case failure::conflict: dr << fail_conflict; break;
    case failure::state:    dr << fail_state;    break;
    case failure::config:   dr << fail_config;   break;
    case failure::version:  dr << fail_version;  break;
    case failure::corrupt:  dr << fail_corrupt;  break;
    case failure::adapter:  dr << fail_adapter;  break;
    case failure::internal: dr << fail;          break;
    }

    dr << t.reason;

    if (*t.error == failure::conflict)
    {
      for (const string& p: a.conflicts)
        dr << info << "conflict: " << p;
    }

    if (!t.hint.empty ())
      dr << info << t.hint;

    dr << endf;
  }

  // Check the preconditions, switch to the target branch, and create the
  // record in the merging phase.
  //
  static void
  start (context& ctx, release_attempt& a, command c)
  {
    const options& o (ctx.opts);
    repository& r (ctx.repo);

    const string& src (o.source_branch ());
    const string& tgt (o.target_branch ());

    if (r.merging ())
      fail_state << "merge is in progress" <<
        info << "conclude or abort it before starting a release";

    if (!r.clean ())
      fail_state << "working tree is not clean" <<
        info << "run 'git status' for details" <<
        info << "use 'git stash' to temporarily hide the changes";

    if (!r.branch_exists (tgt))
      fail_state << "target branch '" << tgt << "' does not exist";

    if (!r.branch_exists (src))
      fail_state << "source branch '" << src << "' does not exist";

    optional<string> sc (r.resolve (src));
    optional<string> tc (r.resolve (tgt));

    if (!sc || !tc)
      fail_adapter << "unable to resolve branches '" << src << "' and '"
                   << tgt << "'";

    if (r.ancestor (*sc, *tc))
      fail_state << "source branch '" << src << "' has no commits that are "
                 << "not in target branch '" << tgt << "'" <<
        info << "nothing to release";

    try
    {
      a.id = uuid::generate (false /* strong */).string ();
    }
    catch (const system_error& e)
    {
      fail << "unable to generate release attempt id: " << e;
    }
    catch (const runtime_error& e)
    {
      fail << "unable to generate release attempt id: " << e;
    }

    // Switch to the target branch remembering where we were (by commit if
    // HEAD is detached).
    //
    optional<string> orig;
    {
      string b (r.branch ());

      if (b != tgt)
      {
        orig = b.empty () ? r.head () : move (b);

        if (verb)
          text << "switching to branch " << tgt;

        r.checkout (tgt);
      }
    }

    // Read and validate the base version switching back on failure since
    // nothing is recorded yet.
    //
    string base;
    try
    {
      base = read_version (r, ctx.files);
      resolve_version (o.scheme (), base, o.bump ());
    }
    catch (const failed&)
    {
      if (orig)
        r.checkout (*orig);

      throw;
    }

    a.phase = release_phase::merging;
    a.source_branch = src;
    a.target_branch = tgt;
    a.scheme = o.scheme ();
    a.base_version = move (base);
    a.bump = o.bump ();
    a.original_branch = orig;
    a.merge_base = r.head ();
    a.edit = (c == command::edit);

    if (orig)
      push_undo (a, undo_kind::checkout, *orig);

    push_undo (a, undo_kind::merge, *a.merge_base);

    a.created = now ();
    save (ctx, a);

    if (verb)
      text << "started release attempt " << a.id << " of version "
           << a.base_version;
  }

  static void
  record_merge (context& ctx, release_attempt& a, string commit)
  {
    a.merge_commit = move (commit);
    a.conflicts.clear ();
    a.phase = release_phase::ready_to_bump;
    save (ctx, a);
  }

  static void
  record_bump (context& ctx, release_attempt& a, string commit)
  {
    a.bump_commit = move (commit);
    a.phase = release_phase::bumped;
    save (ctx, a);
  }

  static void
  bump (context& ctx, release_attempt& a)
  {
    const options& o (ctx.opts);
    repository& r (ctx.repo);

    // Resolve the version once, on the first bump attempt.
    //
    if (!a.resolved_version)
    {
      a.resolved_version = resolve_version (a.scheme,
                                            a.base_version,
                                            a.bump);
      a.tag = tag_name (o, *a.resolved_version);
    }

    const string& v (*a.resolved_version);
    strings ps (version_paths (ctx.files));

    a.bump_base = r.head ();

    for (const string& p: ps)
      push_undo (a, undo_kind::restore, p);

    push_undo (a, undo_kind::bump, *a.bump_base);

    a.phase = release_phase::bumping;
    save (ctx, a);

    if (verb)
      text << "bumping version " << a.base_version << " to " << v;

    string c;
    try
    {
      write_version (r, ctx.files, v);
      c = r.commit (bump_message (o, v), ps);
    }
    catch (const failed& e)
    {
      if (e.kind != failure::adapter)
        throw;

      // Fall back to ready-to-bump so that the step can be retried with the
      // same version.
      //
      try
      {
        r.restore (ps);
      }
      catch (const failed&)
      {
        warn << "unable to restore version files" <<
          info << "run 'git checkout HEAD -- <file>...' before retrying";
      }

      a.phase = release_phase::ready_to_bump;
      save (ctx, a);

      throw;
    }

    record_bump (ctx, a, move (c));
  }

  static void
  tag (context& ctx, release_attempt& a)
  {
    const options& o (ctx.opts);
    const string& v (*a.resolved_version);

    a.phase = release_phase::tagging;
    push_undo (a, undo_kind::tag, *a.tag);
    save (ctx, a);

    if (verb)
      text << "tagging " << *a.bump_commit << " as " << *a.tag;

    ctx.repo.tag (*a.tag,
                  *a.bump_commit,
                  o.no_annotate () ? string () : tag_message (o, v));
  }

  // Return true if the commit at the head of the target branch was made by
  // the attempt and can be discarded by the rollback. Besides the recorded
  // merge and bump commits these are the merge or bump commit made but not
  // recorded due to a crash and, while paused before the bump, the custom
  // commits on top of the merge.
  //
  static bool
  attempt_commit (context& ctx, const release_attempt& a, const string& c)
  {
    repository& r (ctx.repo);

    if ((a.merge_commit && c == *a.merge_commit) ||
        (a.bump_base    && c == *a.bump_base)    ||
        (a.bump_commit  && c == *a.bump_commit))
      return true;

    switch (a.phase)
    {
    case release_phase::merging:
    case release_phase::merge_conflict:
      {
        optional<string> p (r.parent (c));
        optional<string> s (r.resolve (a.source_branch));

        return p && *p == *a.merge_base && s && r.ancestor (*s, c);
      }
    case release_phase::awaiting_commit:
      {
        return r.ancestor (*a.merge_commit, c);
      }
    case release_phase::bumping:
      {
        optional<string> p (r.parent (c));

        return p && *p == *a.bump_base &&
          r.subject (c) == bump_subject (ctx.opts, *a.resolved_version);
      }
    default:
      return false;
    }
  }

  static void
  rollback (context& ctx, release_attempt& a)
  {
    repository& r (ctx.repo);
    const string& tgt (a.target_branch);

    if (verb)
      text << "aborting release attempt " << a.id;

    // Perform the steps in the reverse order noting those that have failed
    // (the diagnostics has already been issued). Every step must be a no-op
    // if the forward step didn't happen.
    //
    strings fs;
    auto step = [&fs] (const string& what, const function<void ()>& f)
    {
      try
      {
        f ();
      }
      catch (const failed&)
      {
        fs.push_back (what);
      }
    };

    // Only the target branch is ever rolled back. If something else is
    // checked out, then switch to the target branch provided there is
    // nothing to lose, remembering where we were.
    //
    bool target (true);
    optional<string> away;
    {
      string b (r.branch ());

      if (b != tgt)
      {
        target = false;

        step ("check out " + tgt,
              [&r, &tgt, &b, &target, &away] ()
              {
                if (!r.clean ())
                  fail_state << (b.empty ()
                                 ? string ("detached HEAD")
                                 : "branch '" + b + "'")
                             << " has uncommitted changes" <<
                    info << "unable to switch to branch '" << tgt << "'";

                away = b.empty () ? r.head () : b;

                r.checkout (tgt);
                target = true;
              });
      }
    }

    // Steps that change the working tree or the branch are skipped (and
    // reported as failed) unless we are on the target branch.
    //
    auto tree_step = [&step, &fs, &target] (const string& what,
                                            const function<void ()>& f)
    {
      if (target)
        step (what, f);
      else
        fs.push_back (what);
    };

    if (target)
      step ("abort merge",
            [&r] ()
            {
              if (r.merging ())
                r.abort_merge ();
            });

    for (const undo_step& u: reverse_iterate (a.undo))
    {
      const string& arg (u.argument);

      switch (u.kind)
      {
      case undo_kind::tag:
        {
          step ("delete tag " + arg,
                [&r, &a, &arg] ()
                {
                  optional<string> t (r.tag_target (arg));

                  if (t && a.bump_commit && *t == *a.bump_commit)
                    r.delete_tag (arg);
                });
          break;
        }
      case undo_kind::bump:
      case undo_kind::merge:
        {
          // Never discard commits the attempt hasn't made.
          //
          tree_step ("reset branch '" + tgt + "' to " + arg,
                     [&ctx, &r, &a, &tgt, &arg] ()
                     {
                       string h (r.head ());

                       if (h == arg)
                         return;

                       if (!attempt_commit (ctx, a, h))
                         fail_state << "branch '" << tgt << "' is at " << h
                                    << " which is not a commit of release "
                                    << "attempt " << a.id <<
                           info << "commits after " << arg << " are left "
                                << "in place";

                       r.reset (arg);
                     });
          break;
        }
      case undo_kind::restore:
        {
          tree_step ("restore " + arg,
                     [&r, &arg] ()
                     {
                       r.restore (strings {arg});
                     });
          break;
        }
      case undo_kind::checkout:
        {
          step ("check out " + arg,
                [&r, &arg] ()
                {
                  r.checkout (arg);
                });
          break;
        }
      }
    }

    // Return to where we were unless the attempt itself switched branches
    // (in which case we are back where it started).
    //
    if (away && !a.original_branch)
      step ("check out " + *away,
            [&r, &away] ()
            {
              r.checkout (*away);
            });

    a.phase = release_phase::aborted;

    if (ctx.opts.keep_record ())
      save (ctx, a);
    else
      ctx.store.clear ();

    if (!fs.empty ())
    {
      diag_record dr (fail);
      dr << "unable to completely roll back release attempt " << a.id;

      for (const string& s: fs)
        dr << info << "failed to " << s;

      dr << info << "repository needs manual correction" << endf;
    }

    if (verb)
      text << "aborted release attempt " << a.id;
  }

  // Perform the action returning true if the engine should keep
  // advancing.
  //
  static bool
  act (context& ctx,
       release_attempt& a,
       const observations& ob,
       const transition& t,
       command c)
  {
    const options& o (ctx.opts);
    repository& r (ctx.repo);

    switch (t.act)
    {
    case action::none:
      {
        return false;
      }
    case action::start:
      {
        start (ctx, a, c);
        return true;
      }
    case action::merge:
      {
        if (verb)
          text << "merging '" << a.source_branch << "' into '"
               << a.target_branch << "'";

        merge_outcome m (
          r.merge (a.source_branch,
                   merge_message (o, a.source_branch, a.target_branch)));

        if (m.conflicted)
        {
          a.conflicts = move (m.paths);
          a.phase = release_phase::merge_conflict;
          save (ctx, a);

          report_conflicts (a);
        }

        record_merge (ctx, a, r.head ());
        return true;
      }
    case action::adopt_merge:
      {
        l4 ([&]{text << "adopting merge commit " << ob.head;});

        record_merge (ctx, a, ob.head);
        return true;
      }
    case action::wait_conflict:
      {
        a.conflicts = r.unmerged ();
        a.phase = release_phase::merge_conflict;
        save (ctx, a);

        report_conflicts (a);
      }
    case action::conclude_merge:
      {
        if (verb)
          text << "concluding merge of '" << a.source_branch << "'";

        record_merge (
          ctx,
          a,
          r.commit (merge_message (o, a.source_branch, a.target_branch),
                    strings ()));
        return true;
      }
    case action::suspend:
      {
        if (a.phase == release_phase::ready_to_bump)
        {
          a.phase = release_phase::awaiting_commit;
          a.edit = false;
          save (ctx, a);

          if (verb)
            text << "paused before the version bump" <<
              info << "commit the changes to '" << a.target_branch
                   << "' and run 'prel --continue'";
        }
        else
        {
          a.edit = true;
          save (ctx, a);

          if (verb)
            text << "will pause before the version bump";
        }

        return false;
      }
    case action::resume:
      {
        if (verb)
          text << "resuming release attempt " << a.id;

        // Custom commits are part of the attempt.
        //
        a.phase = release_phase::ready_to_bump;
        a.bump_base = ob.head;
        a.edit = false;
        save (ctx, a);
        return true;
      }
    case action::bump:
      {
        bump (ctx, a);
        return true;
      }
    case action::adopt_bump:
      {
        l4 ([&]{text << "adopting bump commit " << ob.head;});

        record_bump (ctx, a, ob.head);
        return true;
      }
    case action::tag:
    case action::adopt_tag:
      {
        if (t.act == action::tag)
          tag (ctx, a);
        else
          l4 ([&]{text << "adopting tag " << *a.tag;});

        a.phase = release_phase::completed;
        save (ctx, a);
        return true;
      }
    case action::finish:
      {
        if (!o.keep_record ())
          ctx.store.clear ();

        if (verb)
          text << "released version " << *a.resolved_version << " as tag "
               << *a.tag;

        return false;
      }
    case action::rollback:
      {
        rollback (ctx, a);
        return false;
      }
    }

    return false; // Can't be here.
  }

  int
  cmd_release (const options& o, command c, repository& r, state_store& s)
  {
    tracer trace ("cmd_release");

    assert (c != command::status);

    // A completed or aborted record kept for audit does not block a new
    // attempt.
    //
    release_attempt a;
    if (optional<release_attempt> l = s.load ())
    {
      if (!terminal (l->phase))
        a = move (*l);
    }

    bool started (a.phase != release_phase::not_started);

    if (c == command::abort && !started)
    {
      if (verb)
        text << "no release attempt in progress";

      return 0;
    }

    version_files fs;
    if (c != command::abort)
    {
      if (!started && c != command::continue_)
      {
        if (o.source_branch ().empty ())
          fail_config << "no source branch specified" <<
            info << "use --source-branch or specify it in " << options_file;

        if (o.target_branch ().empty ())
          fail_config << "no target branch specified" <<
            info << "use --target-branch or specify it in " << options_file;

        if (o.source_branch () == o.target_branch ())
          fail_config << "source and target branches are both '"
                      << o.source_branch () << "'";
      }

      fs = parse_version_files (o);

      // Verify the formats before touching anything.
      //
      merge_message (o, "source", "target");
      bump_message (o, "0");
      tag_name (o, "0");
      tag_message (o, "0");
    }

    if (started)
    {
      // The record is the source of truth for what it fixes at the start.
      //
      auto ignored = [&a] (const char* n, const string& v, const string& r)
      {
        warn << "ignoring " << n << " '" << v << "'" <<
          info << "release attempt " << a.id << " uses '" << r << "'";
      };

      if (o.source_branch_specified () &&
          o.source_branch () != a.source_branch)
        ignored ("--source-branch", o.source_branch (), a.source_branch);

      if (o.target_branch_specified () &&
          o.target_branch () != a.target_branch)
        ignored ("--target-branch", o.target_branch (), a.target_branch);

      if (o.scheme_specified () && o.scheme () != a.scheme)
        ignored ("--scheme", to_string (o.scheme ()), to_string (a.scheme));

      if (o.bump_specified () && o.bump () != a.bump)
        ignored ("--bump", to_string (o.bump ()), to_string (a.bump));

      if (o.stale_days () != 0)
      {
        using namespace chrono;

        auto d (duration_cast<hours> (system_clock::now () - a.updated));

        if (d > hours (24 * o.stale_days ()))
          warn << "release attempt " << a.id << " was last updated "
               << d.count () / 24 << " days ago" <<
            info << "use --abort to discard it if it is no longer relevant";
      }
    }

    // Only the first step is driven by the command, the rest is the
    // default run.
    //
    context ctx {o, r, s, move (fs)};

    if (c == command::edit                     &&
        a.phase > release_phase::not_started   &&
        a.phase < release_phase::ready_to_bump &&
        a.phase != release_phase::merge_conflict)
      a.edit = true;

    for (;; c = command::run)
    {
      string bs (a.resolved_version
                 ? bump_subject (o, *a.resolved_version)
                 : string ());

      observations ob (observe (r, a, bs));
      transition t (decide (a, ob, c));

      l4 ([&]{trace << a.phase << " + " << c << " -> " << t.next << " ("
                    << t.act << ")";});

      if (t.error)
        report (a, t);

      if (!act (ctx, a, ob, t, c))
        break;
    }

    return 0;
  }
}
