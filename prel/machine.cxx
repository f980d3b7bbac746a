// file      : prel/machine.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <prel/machine.hxx>

using namespace std;
using namespace butl;

namespace prel
{
  string
  to_string (command c)
  {
    switch (c)
    {
    case command::run:       return "run";
    case command::edit:      return "edit";
    case command::continue_: return "continue";
    case command::abort:     return "abort";
    case command::status:    return "status";
    }

    return string (); // Can't be here.
  }

  string
  to_string (action a)
  {
    switch (a)
    {
    case action::none:           return "none";
    case action::start:          return "start";
    case action::merge:          return "merge";
    case action::adopt_merge:    return "adopt-merge";
    case action::wait_conflict:  return "wait-conflict";
    case action::conclude_merge: return "conclude-merge";
    case action::suspend:        return "suspend";
    case action::resume:         return "resume";
    case action::bump:           return "bump";
    case action::adopt_bump:     return "adopt-bump";
    case action::tag:            return "tag";
    case action::adopt_tag:      return "adopt-tag";
    case action::finish:         return "finish";
    case action::rollback:       return "rollback";
    }

    return string (); // Can't be here.
  }

  bool
  conflict_markers (const string& c)
  {
    for (size_t b (0), e; b < c.size (); b = e + 1)
    {
      e = c.find ('\n', b);

      if (e == string::npos)
        e = c.size ();

      size_t n (e - b);

      if (n != 0 && c[e - 1] == '\r')
        --n;

      if (n >= 7)
      {
        // <<<<<<< ours, ||||||| base (diff3), =======, >>>>>>> theirs.
        //
        char m (c[b]);

        if ((m == '<' || m == '|' || m == '=' || m == '>') &&
            c.compare (b, 7, string (7, m)) == 0                &&
            (m == '=' ? n == 7 : (n == 7 || c[b + 7] == ' ')))
          return true;
      }
    }

    return false;
  }

  observations
  observe (repository& r, const release_attempt& a, const string& bs)
  {
    observations o;

    if (a.phase == release_phase::not_started || terminal (a.phase))
      return o;

    o.clean = r.clean ();
    o.branch = r.branch ();
    o.head = r.head ();
    o.merging = r.merging ();

    // Unresolved conflicts are either unmerged index entries or conflict
    // markers left in the recorded paths (resolution is binary and we don't
    // try to interpret partially edited files).
    //
    o.conflicts = !r.unmerged ().empty ();

    for (const string& p: a.conflicts)
    {
      if (o.conflicts)
        break;

      path f (p);
      o.conflicts = r.exists (f) && conflict_markers (r.read (f));
    }

    if (a.merge_base && o.head != *a.merge_base)
    {
      if (optional<string> s = r.resolve (a.source_branch))
        o.source_merged = r.ancestor (*s, o.head) &&
                          r.ancestor (*a.merge_base, o.head);
    }

    if (a.merge_commit)
      o.merge_commit_exists = r.commit_exists (*a.merge_commit);

    if (a.bump_commit)
      o.bump_commit_exists = r.commit_exists (*a.bump_commit);

    if (a.bump_base && !bs.empty () && o.head != *a.bump_base)
    {
      optional<string> p (r.parent (o.head));
      o.bump_committed = p && *p == *a.bump_base && r.subject (o.head) == bs;
    }

    if (a.tag)
      o.tag_target = r.tag_target (*a.tag);

    return o;
  }

  transition
  decide (const release_attempt& a, const observations& o, command c)
  {
    using phase = release_phase;

    phase p (a.phase);

    auto stay = [p] () {return transition {p};};
    auto go = [] (phase n, action x) {return transition {n, x};};

    auto error = [p] (failure f, string r, string h = string ())
    {
      transition t {p};
      t.error = f;
      t.reason = move (r);
      t.hint = move (h);
      return t;
    };

    string discard ("use --abort to discard release attempt " + a.id);

    if (c == command::status)
      return stay ();

    if (c == command::abort)
      return p == phase::not_started || terminal (p)
        ? stay ()
        : go (phase::aborted, action::rollback);

    switch (p)
    {
    case phase::not_started:
      {
        if (c == command::continue_)
          return error (failure::state,
                        "no release attempt in progress",
                        "run without --continue to start one");

        return go (phase::merging, action::start);
      }
    case phase::completed: return go (phase::completed, action::finish);
    case phase::aborted:   return stay ();
    default:               break;
    }

    // The repository must still match the record.
    //
    if (o.branch != a.target_branch)
      return error (failure::state,
                    (o.branch.empty ()
                     ? string ("HEAD is detached")
                     : "current branch '" + o.branch + "'") +
                    " while release attempt " + a.id + " is on '" +
                    a.target_branch + "'",
                    "check out '" + a.target_branch + "' or " + discard);

    if (!o.merge_commit_exists)
      return error (failure::state,
                    "merge commit " + *a.merge_commit + " of release "
                    "attempt " + a.id + " no longer exists",
                    discard);

    if (!o.bump_commit_exists)
      return error (failure::state,
                    "bump commit " + *a.bump_commit + " of release "
                    "attempt " + a.id + " no longer exists",
                    discard);

    if (c == command::edit && p >= phase::bumping)
      return error (failure::state, "version bump already started");

    const char* dirty ("working tree is not clean");

    switch (p)
    {
    case phase::merging:
      {
        // Edit only sets the flag at this point.
        //
        if (o.merging)
          return o.conflicts
            ? go (phase::merge_conflict, action::wait_conflict)
            : go (phase::ready_to_bump, action::conclude_merge);

        if (o.source_merged)
          return go (phase::ready_to_bump, action::adopt_merge);

        if (o.head != *a.merge_base)
          return error (failure::state,
                        "target branch has moved since release attempt " +
                        a.id + " started",
                        discard);

        if (!o.clean)
          return error (failure::state, dirty);

        return go (phase::ready_to_bump, action::merge);
      }
    case phase::merge_conflict:
      {
        if (c == command::edit)
          return go (phase::merge_conflict, action::suspend);

        if (o.conflicts)
          return error (failure::conflict,
                        "unresolved merge conflicts remain",
                        "resolve the conflicts and run 'prel --continue'");

        if (c == command::run)
          return error (failure::state,
                        "merge conflicts are resolved",
                        "run 'prel --continue' to resume the release");

        if (o.merging)
          return go (phase::ready_to_bump, action::conclude_merge);

        if (o.source_merged)
        {
          if (!o.clean)
            return error (failure::state,
                          dirty,
                          "commit or stash the changes and run "
                          "'prel --continue'");

          return go (phase::ready_to_bump, action::adopt_merge);
        }

        return error (failure::state, "merge is no longer in progress",
                      discard);
      }
    case phase::awaiting_commit:
      {
        if (c == command::edit)
          return stay ();

        if (c == command::run)
          return error (failure::state,
                        "release attempt is paused for a custom commit",
                        "run 'prel --continue' once the commit is made");

        if (!o.clean)
          return error (failure::state,
                        dirty,
                        "commit or stash the changes and run "
                        "'prel --continue'");

        return go (phase::ready_to_bump, action::resume);
      }
    case phase::ready_to_bump:
      {
        if (c == command::edit || a.edit)
          return go (phase::awaiting_commit, action::suspend);

        if (!o.clean)
          return error (failure::state, dirty);

        return go (phase::bumped, action::bump);
      }
    case phase::bumping:
      {
        // The version files may be rewritten, so don't check the working
        // tree.
        //
        if (o.bump_committed)
          return go (phase::bumped, action::adopt_bump);

        if (o.head != *a.bump_base)
          return error (failure::state,
                        "HEAD has moved since the version bump started",
                        discard);

        return go (phase::bumped, action::bump);
      }
    case phase::bumped:
    case phase::tagging:
      {
        if (o.tag_target)
        {
          if (*o.tag_target == *a.bump_commit)
            return go (phase::completed, action::adopt_tag);

          return error (failure::state,
                        "tag '" + *a.tag + "' already exists and points to "
                        "a different commit",
                        "remove the tag and retry or " + discard);
        }

        return go (phase::completed, action::tag);
      }
    case phase::not_started:
    case phase::completed:
    case phase::aborted:
      break;
    }

    return stay (); // Can't be here.
  }
}
