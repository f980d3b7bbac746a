// file      : prel/status.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <prel/status.hxx>

#include <libbutl/json/serializer.hxx>

#include <prel/machine.hxx>
#include <prel/release.hxx>
#include <prel/diagnostics.hxx>

using namespace std;

namespace prel
{
  // Describe what the default run would do next.
  //
  static string
  next_action (const release_attempt& a, const transition& t)
  {
    if (t.error)
      return t.hint.empty () ? t.reason : t.hint;

    switch (t.act)
    {
    case action::merge:
      return "run 'prel' to merge '" + a.source_branch + "' into '" +
             a.target_branch + "'";
    case action::adopt_merge:
    case action::conclude_merge:
      return "run 'prel' to record the merge and bump the version";
    case action::wait_conflict:
      return "run 'prel' to record the merge conflicts";
    case action::suspend:
      return "run 'prel' to pause for a custom commit";
    case action::bump:
      return "run 'prel' to bump the version and tag the release";
    case action::adopt_bump:
      return "run 'prel' to record the bump commit and tag the release";
    case action::tag:
    case action::adopt_tag:
      return "run 'prel' to tag the release";
    case action::none:
    case action::start:
    case action::resume:
    case action::finish:
    case action::rollback:
      break;
    }

    return string ();
  }

  static const char* time_format ("%Y-%m-%dT%H:%M:%SZ");

  int
  cmd_status (const options& o,
              repository& r,
              const state_store& s,
              ostream& os)
  {
    tracer trace ("cmd_status");

    optional<release_attempt> l (s.load ());
    bool ip (l && !terminal (l->phase));

    optional<transition> t;
    string problem;
    string next;

    if (ip)
    {
      const release_attempt& a (*l);

      string bs (a.resolved_version
                 ? bump_subject (o, *a.resolved_version)
                 : string ());

      t = decide (a, observe (r, a, bs), command::run);

      if (t->error)
        problem = t->reason;

      next = next_action (a, *t);
    }

    switch (o.stdout_format ())
    {
    case stdout_format::lines:
      {
        if (!ip)
        {
          os << "no release in progress" << endl;

          if (l)
            os << "last attempt " << l->id << ' ' << l->phase << endl;

          break;
        }

        const release_attempt& a (*l);

        os << "release attempt " << a.id << '\n'
           << "  phase:    " << a.phase << '\n'
           << "  source:   " << a.source_branch << '\n'
           << "  target:   " << a.target_branch << '\n'
           << "  scheme:   " << a.scheme << '\n'
           << "  current:  " << a.base_version << '\n'
           << "  bump:     " << a.bump << '\n';

        if (a.resolved_version)
          os << "  release:  " << *a.resolved_version << '\n';

        if (a.tag)
          os << "  tag:      " << *a.tag << '\n';

        if (a.edit)
          os << "  edit:     yes" << '\n';

        for (const string& c: a.conflicts)
          os << "  conflict: " << c << '\n';

        os << "  updated:  "
           << butl::to_string (a.updated, time_format, false, false) << '\n';

        if (!problem.empty ())
          os << "  problem:  " << problem << '\n';

        if (!next.empty ())
          os << "next: " << next << '\n';

        os.flush ();
        break;
      }
    case stdout_format::json:
      {
        butl::json::stream_serializer ss (os);

        ss.begin_object ();
        ss.member ("in_progress", ip);

        if (l)
        {
          const release_attempt& a (*l);

          ss.member ("attempt", a.id);
          ss.member ("phase", to_string (a.phase));
          ss.member ("source_branch", a.source_branch);
          ss.member ("target_branch", a.target_branch);
          ss.member ("scheme", to_string (a.scheme));
          ss.member ("base_version", a.base_version);
          ss.member ("bump", to_string (a.bump));

          if (a.resolved_version)
            ss.member ("resolved_version", *a.resolved_version);

          if (a.merge_commit)
            ss.member ("merge_commit", *a.merge_commit);

          if (a.bump_commit)
            ss.member ("bump_commit", *a.bump_commit);

          if (a.tag)
            ss.member ("tag", *a.tag);

          if (!a.conflicts.empty ())
          {
            ss.member_name ("conflicts", false /* check */);
            ss.begin_array ();

            for (const string& c: a.conflicts)
              ss.value (c);

            ss.end_array ();
          }

          ss.member ("updated",
                     butl::to_string (a.updated, time_format, false, false));

          if (!problem.empty ())
            ss.member ("problem", problem);

          if (!next.empty ())
            ss.member ("next", next);
        }

        ss.end_object ();
        os << endl;
        break;
      }
    }

    l4 ([&]{trace << "in progress: " << ip;});

    return ip ? exit_in_progress : exit_success;
  }
}
