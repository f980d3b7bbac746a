// file      : prel/attempt.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <prel/attempt.hxx>

#include <chrono>

using namespace std;
using namespace butl;

namespace prel
{
  static const char* phase_names[] = {
    "not-started",
    "merging",
    "merge-conflict",
    "awaiting-commit",
    "ready-to-bump",
    "bumping",
    "bumped",
    "tagging",
    "completed",
    "aborted"};

  string
  to_string (release_phase p)
  {
    return phase_names[static_cast<size_t> (p)];
  }

  release_phase
  to_release_phase (const string& s)
  {
    size_t n (sizeof (phase_names) / sizeof (phase_names[0]));

    for (size_t i (0); i != n; ++i)
    {
      if (s == phase_names[i])
        return static_cast<release_phase> (i);
    }

    throw invalid_argument ("invalid release phase '" + s + '\'');
  }

  string
  to_string (undo_kind k)
  {
    switch (k)
    {
    case undo_kind::checkout: return "checkout";
    case undo_kind::merge:    return "merge";
    case undo_kind::restore:  return "restore";
    case undo_kind::bump:     return "bump";
    case undo_kind::tag:      return "tag";
    }

    return string (); // Can't be here.
  }

  undo_kind
  to_undo_kind (const string& s)
  {
         if (s == "checkout") return undo_kind::checkout;
    else if (s == "merge")    return undo_kind::merge;
    else if (s == "restore")  return undo_kind::restore;
    else if (s == "bump")     return undo_kind::bump;
    else if (s == "tag")      return undo_kind::tag;
    else throw invalid_argument ("invalid undo step kind '" + s + '\'');
  }

  static const char* time_format ("%Y-%m-%dT%H:%M:%SZ");

  timestamp
  now ()
  {
    using namespace chrono;

    return timestamp (
      duration_cast<seconds> (system_clock::now ().time_since_epoch ()));
  }

  // release_attempt
  //
  release_attempt::
  release_attempt (manifest_parser& p)
  {
    manifest_name_value nv (p.next ());

    auto bad_name = [&p, &nv] (const string& d)
    {
      throw manifest_parsing (p.name (), nv.name_line, nv.name_column, d);
    };

    auto bad_value = [&p, &nv] (const string& d)
    {
      throw manifest_parsing (p.name (), nv.value_line, nv.value_column, d);
    };

    // Make sure this is the start and we support the version.
    //
    if (!nv.name.empty ())
      bad_name ("start of release attempt manifest expected");

    if (nv.value != "1")
      bad_value ("unsupported format version");

    // Parse the optional value making sure it is not specified twice.
    //
    auto assign = [&bad_name, &bad_value, &nv] (optional<string>& r)
    {
      if (r)
        bad_name ("duplicate " + nv.name + " value");

      if (nv.value.empty ())
        bad_value ("empty " + nv.name + " value");

      r = move (nv.value);
    };

    auto parse_time = [&bad_value, &nv] (timestamp& r)
    {
      if (r != timestamp_unknown)
        bad_value ("duplicate " + nv.name + " value");

      try
      {
        const char* e (nullptr);
        r = butl::from_string (nv.value.c_str (),
                               time_format,
                               false /* local */,
                               &e);

        if (*e != '\0')
          throw invalid_argument ("junk after time");
      }
      catch (const invalid_argument&)
      {
        bad_value ("invalid " + nv.name + " time '" + nv.value + "'");
      }
      catch (const system_error&)
      {
        bad_value ("invalid " + nv.name + " time '" + nv.value + "'");
      }
    };

    optional<string> ph, sc, bm, ed;

    for (nv = p.next (); !nv.empty (); nv = p.next ())
    {
      string& n (nv.name);
      string& v (nv.value);

      if (n == "attempt")
      {
        if (!id.empty ())
          bad_name ("duplicate attempt value");

        if (v.empty ())
          bad_value ("empty attempt value");

        id = move (v);
      }
      else if (n == "phase")
      {
        assign (ph);
      }
      else if (n == "source-branch" || n == "target-branch")
      {
        string& r (n == "source-branch" ? source_branch : target_branch);

        if (!r.empty ())
          bad_name ("duplicate " + n + " value");

        if (v.empty ())
          bad_value ("empty " + n + " value");

        r = move (v);
      }
      else if (n == "scheme")
      {
        assign (sc);
      }
      else if (n == "base-version")
      {
        if (!base_version.empty ())
          bad_name ("duplicate base-version value");

        if (v.empty ())
          bad_value ("empty base-version value");

        base_version = move (v);
      }
      else if (n == "bump")             assign (bm);
      else if (n == "resolved-version") assign (resolved_version);
      else if (n == "original-branch")  assign (original_branch);
      else if (n == "merge-base")       assign (merge_base);
      else if (n == "merge-commit")     assign (merge_commit);
      else if (n == "bump-base")        assign (bump_base);
      else if (n == "bump-commit")      assign (bump_commit);
      else if (n == "tag")              assign (tag);
      else if (n == "edit")             assign (ed);
      else if (n == "conflict")
      {
        if (v.empty ())
          bad_value ("empty conflict path");

        conflicts.push_back (move (v));
      }
      else if (n == "undo")
      {
        size_t i (v.find (' '));

        if (i == string::npos || i + 1 == v.size ())
          bad_value ("undo step kind and argument expected");

        try
        {
          undo.push_back (undo_step {to_undo_kind (string (v, 0, i)),
                                     string (v, i + 1)});
        }
        catch (const invalid_argument& e)
        {
          bad_value (e.what ());
        }
      }
      else if (n == "created") parse_time (created);
      else if (n == "updated") parse_time (updated);
      else
        unknown.push_back (move (nv));
    }

    // Verify all non-optional values were specified and convert the
    // enumerations.
    //
    auto require = [&bad_value] (bool v, const char* n)
    {
      if (!v)
        bad_value (string ("no ") + n + " specified");
    };

    require (!id.empty (),                 "attempt");
    require (ph != nullopt,                "phase");
    require (!source_branch.empty (),      "source-branch");
    require (!target_branch.empty (),      "target-branch");
    require (sc != nullopt,                "scheme");
    require (!base_version.empty (),       "base-version");
    require (bm != nullopt,                "bump");
    require (created != timestamp_unknown, "created");
    require (updated != timestamp_unknown, "updated");

    try
    {
      phase  = to_release_phase (*ph);
      scheme = to_version_scheme (*sc);
      bump   = to_bump_kind (*bm);
    }
    catch (const invalid_argument& e)
    {
      bad_value (e.what ());
    }

    if (ed)
    {
      if (*ed != "true")
        bad_value ("invalid edit value '" + *ed + "'");

      edit = true;
    }

    // Verify that the values required by the phase are present. A record
    // that fails this check could not have been written by us.
    //
    auto need = [this, &bad_value] (bool v, const char* n)
    {
      if (!v)
        bad_value (string ("no ") + n + " specified for phase " +
                   to_string (phase));
    };

    if (phase >= release_phase::merging)
      need (merge_base != nullopt, "merge-base");

    if (phase >= release_phase::awaiting_commit && !terminal (phase))
      need (merge_commit != nullopt, "merge-commit");

    if (phase >= release_phase::bumping && !terminal (phase))
    {
      need (resolved_version != nullopt, "resolved-version");
      need (tag != nullopt,              "tag");
      need (bump_base != nullopt,        "bump-base");
    }

    if (phase >= release_phase::bumped && !terminal (phase))
      need (bump_commit != nullopt, "bump-commit");

    // There should be a single manifest.
    //
    nv = p.next ();
    if (!nv.empty ())
      bad_name ("single release attempt manifest expected");
  }

  void release_attempt::
  serialize (manifest_serializer& s) const
  {
    s.next ("", "1"); // Start of manifest.

    s.next ("attempt", id);
    s.next ("phase", to_string (phase));
    s.next ("source-branch", source_branch);
    s.next ("target-branch", target_branch);
    s.next ("scheme", to_string (scheme));
    s.next ("base-version", base_version);
    s.next ("bump", to_string (bump));

    auto opt = [&s] (const char* n, const optional<string>& v)
    {
      if (v)
        s.next (n, *v);
    };

    opt ("resolved-version", resolved_version);
    opt ("original-branch",  original_branch);
    opt ("merge-base",       merge_base);
    opt ("merge-commit",     merge_commit);
    opt ("bump-base",        bump_base);
    opt ("bump-commit",      bump_commit);
    opt ("tag",              tag);

    if (edit)
      s.next ("edit", "true");

    for (const string& c: conflicts)
      s.next ("conflict", c);

    for (const undo_step& u: undo)
      s.next ("undo", to_string (u.kind) + ' ' + u.argument);

    s.next ("created", butl::to_string (created, time_format, false, false));
    s.next ("updated", butl::to_string (updated, time_format, false, false));

    for (const manifest_name_value& nv: unknown)
      s.next (nv.name, nv.value);

    s.next ("", ""); // End of manifest.
  }

  bool
  operator== (const release_attempt& x, const release_attempt& y)
  {
    if (x.unknown.size () != y.unknown.size ())
      return false;

    for (size_t i (0); i != x.unknown.size (); ++i)
    {
      if (x.unknown[i].name  != y.unknown[i].name ||
          x.unknown[i].value != y.unknown[i].value)
        return false;
    }

    return x.id               == y.id               &&
           x.phase            == y.phase            &&
           x.source_branch    == y.source_branch    &&
           x.target_branch    == y.target_branch    &&
           x.scheme           == y.scheme           &&
           x.base_version     == y.base_version     &&
           x.bump             == y.bump             &&
           x.resolved_version == y.resolved_version &&
           x.original_branch  == y.original_branch  &&
           x.merge_base       == y.merge_base       &&
           x.merge_commit     == y.merge_commit     &&
           x.bump_base        == y.bump_base        &&
           x.bump_commit      == y.bump_commit      &&
           x.tag              == y.tag              &&
           x.edit             == y.edit             &&
           x.conflicts        == y.conflicts        &&
           x.undo             == y.undo             &&
           x.created          == y.created          &&
           x.updated          == y.updated;
  }
}
