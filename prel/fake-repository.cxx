// file      : prel/fake-repository.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <prel/fake-repository.hxx>

#include <prel/diagnostics.hxx>

using namespace std;

namespace prel
{
  string fake_repository::
  add_commit (strings ps, string s, tree fs)
  {
    string id ("c" + to_string (commits.size () + 1));
    commits[id] = commit_info {move (ps), move (s), move (fs)};
    return id;
  }

  void fake_repository::
  move_head (const string& c)
  {
    if (current.empty ())
      detached = c;
    else
      branches[current] = c;
  }

  void fake_repository::
  check (const char* op)
  {
    if (fail_ == op)
    {
      fail_.clear ();
      fail_adapter << "simulated " << op << " failure";
    }
  }

  void fake_repository::
  done (const char* op)
  {
    if (crash_ == op)
    {
      crash_.clear ();
      throw simulated_crash ();
    }
  }

  string fake_repository::
  init (const string& b, tree fs, const string& s)
  {
    string c (add_commit (strings (), s, fs));
    branches[b] = c;
    current = b;
    work = move (fs);
    return c;
  }

  void fake_repository::
  create_branch (const string& b, const string& c)
  {
    assert (commit_exists (c));
    branches[b] = c;
  }

  string fake_repository::
  commit_to (const string& b, const string& s, const tree& fs)
  {
    const string& p (branches.at (b));

    tree t (commits.at (p).files);
    for (const auto& f: fs)
      t[f.first] = f.second;

    string c (add_commit (strings {p}, s, move (t)));
    branches[b] = c;

    if (current == b)
      work = commits.at (c).files;

    return c;
  }

  void fake_repository::
  resolve_conflict (const string& p, const string& c)
  {
    work[p] = c;
    unmerged_paths.erase (
      remove (unmerged_paths.begin (), unmerged_paths.end (), p),
      unmerged_paths.end ());
  }

  size_t fake_repository::
  count (const string& s) const
  {
    size_t r (0);
    for (const auto& c: commits)
    {
      if (c.second.subject == s)
        ++r;
    }
    return r;
  }

  const fake_repository::tree& fake_repository::
  files (const string& c) const
  {
    return commits.at (c).files;
  }

  bool fake_repository::
  clean ()
  {
    return !merging ()              &&
           unmerged_paths.empty ()  &&
           work == files (head ());
  }

  string fake_repository::
  head ()
  {
    if (!current.empty ())
      return branches.at (current);

    if (!detached.empty ())
      return detached;

    fail_adapter << "no commits" << endf;
  }

  optional<string> fake_repository::
  resolve (const string& r)
  {
    auto b (branches.find (r));
    if (b != branches.end ())
      return b->second;

    auto t (tags.find (r));
    if (t != tags.end ())
      return t->second.commit;

    if (commit_exists (r))
      return r;

    return nullopt;
  }

  bool fake_repository::
  ancestor (const string& a, const string& d)
  {
    strings q {d};

    while (!q.empty ())
    {
      string c (move (q.back ()));
      q.pop_back ();

      if (c == a)
        return true;

      for (const string& p: commits.at (c).parents)
        q.push_back (p);
    }

    return false;
  }

  string fake_repository::
  subject (const string& c)
  {
    auto i (commits.find (c));
    if (i == commits.end ())
      fail_adapter << "unknown commit " << c;

    return i->second.subject;
  }

  optional<string> fake_repository::
  parent (const string& c)
  {
    auto i (commits.find (c));
    if (i == commits.end ())
      fail_adapter << "unknown commit " << c;

    const strings& ps (i->second.parents);
    return ps.empty () ? nullopt : optional<string> (ps.front ());
  }

  optional<string> fake_repository::
  tag_target (const string& n)
  {
    auto i (tags.find (n));
    return i != tags.end () ? optional<string> (i->second.commit) : nullopt;
  }

  void fake_repository::
  checkout (const string& r)
  {
    check ("checkout");

    if (!clean ())
      fail_adapter << "local changes would be overwritten by checkout";

    if (branch_exists (r))
    {
      current = r;
      detached.clear ();
    }
    else if (commit_exists (r))
    {
      current.clear ();
      detached = r;
    }
    else
      fail_adapter << "pathspec '" << r << "' did not match";

    work = files (head ());
    done ("checkout");
  }

  merge_outcome fake_repository::
  merge (const string& s, const string& m)
  {
    check ("merge");

    optional<string> sc (resolve (s));
    if (!sc)
      fail_adapter << s << " - not something we can merge";

    string h (head ());

    // The source wins for every file it has that differs.
    //
    tree t (files (h));
    for (const auto& f: files (*sc))
      t[f.first] = f.second;

    merge_outcome r;

    if (!conflict_paths_.empty ())
    {
      for (const string& p: conflict_paths_)
      {
        auto o (files (h).find (p));

        t[p] = "<<<<<<< HEAD\n" +
               (o != files (h).end () ? o->second : string ()) +
               "=======\n" +
               files (*sc).at (p) +
               ">>>>>>> " + s + '\n';
      }

      work = move (t);
      merge_head = *sc;
      unmerged_paths = conflict_paths_;

      r.conflicted = true;
      r.paths = move (conflict_paths_);
      conflict_paths_.clear ();
    }
    else
    {
      move_head (add_commit (strings {h, *sc}, m, t));
      work = move (t);
    }

    done ("merge");
    return r;
  }

  string fake_repository::
  commit (const string& m, const strings&)
  {
    check ("commit");

    if (!unmerged_paths.empty ())
      fail_adapter << "committing is not possible because you have unmerged "
                   << "files";

    string h (head ());

    if (!merging () && work == files (h))
      fail_adapter << "nothing to commit, working tree clean";

    strings ps {h};
    if (merge_head)
      ps.push_back (*merge_head);

    string c (add_commit (move (ps), m, work));
    move_head (c);
    merge_head = nullopt;

    done ("commit");
    return c;
  }

  string fake_repository::
  tag (const string& n, const string& c, const string& m)
  {
    check ("tag");

    if (tag_exists (n))
      fail_adapter << "tag '" << n << "' already exists";

    if (!commit_exists (c))
      fail_adapter << "unknown commit " << c;

    tags[n] = tag_info {c, m};

    done ("tag");
    return m.empty () ? c : "t-" + n;
  }

  void fake_repository::
  delete_tag (const string& n)
  {
    check ("delete_tag");

    if (tags.erase (n) == 0)
      fail_adapter << "tag '" << n << "' not found";

    done ("delete_tag");
  }

  void fake_repository::
  reset (const string& c)
  {
    check ("reset");

    if (!commit_exists (c))
      fail_adapter << "unknown commit " << c;

    move_head (c);
    work = files (c);
    merge_head = nullopt;
    unmerged_paths.clear ();

    done ("reset");
  }

  void fake_repository::
  abort_merge ()
  {
    check ("abort_merge");

    if (!merging ())
      fail_adapter << "there is no merge to abort";

    work = files (head ());
    merge_head = nullopt;
    unmerged_paths.clear ();

    done ("abort_merge");
  }

  void fake_repository::
  restore (const strings& ps)
  {
    check ("restore");

    const tree& h (files (head ()));

    for (const string& p: ps)
    {
      auto i (h.find (p));

      if (i != h.end ())
        work[p] = i->second;
      else
        work.erase (p);
    }

    done ("restore");
  }

  string fake_repository::
  read (const path& p)
  {
    auto i (work.find (p.string ()));
    if (i == work.end ())
      fail_adapter << "unable to read " << p << ": no such file";

    return i->second;
  }

  void fake_repository::
  write (const path& p, const string& c)
  {
    check ("write");
    work[p.string ()] = c;
    done ("write");
  }
}
