// file      : prel/state-store.test.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <iostream>

#include <prel/types.hxx>
#include <prel/utility.hxx>

#include <prel/attempt.hxx>
#include <prel/diagnostics.hxx>
#include <prel/state-store.hxx>

#undef NDEBUG
#include <cassert>

using namespace std;
using namespace butl;

namespace prel
{
  static void
  write_file (const path& f, const string& s)
  {
    ofdstream os (f);
    os << s;
    os.close ();
  }

  static string
  read_file (const path& f)
  {
    ifdstream is (f);
    return is.read_text ();
  }

  int
  main ()
  {
    dir_path td (dir_path::temp_path ("prel-state"));
    auto_rmdir rm (td);

    state_store s (td / prel_dir);

    release_attempt a;
    a.id = "9b1c";
    a.phase = release_phase::merging;
    a.source_branch = "develop";
    a.target_branch = "master";
    a.base_version = "1.4.0";
    a.merge_base = "3f2a";
    a.undo.push_back (undo_step {undo_kind::merge, "3f2a"});
    a.created = a.updated = now ();

    // Basics.
    //
    {
      assert (!s.load ());

      s.save (a);
      assert (exists (s.file ()));
      assert (!exists (s.file () + ".tmp"));

      optional<release_attempt> l (s.load ());
      assert (l && *l == a);

      // Replace.
      //
      a.phase = release_phase::ready_to_bump;
      a.merge_commit = "77e0";
      s.save (a);

      l = s.load ();
      assert (l && *l == a);

      s.clear ();
      assert (!s.load ());

      s.clear (); // No record is not an error.
    }

    // Corrupt and truncated records.
    //
    {
      s.save (a);
      string c (read_file (s.file ()));

      for (const string& b: {string ("attempt: 9b1c\n"),
                             c.substr (0, c.size () / 3),
                             string ("garbage")})
      {
        write_file (s.file (), b);

        try
        {
          s.load ();
          assert (false);
        }
        catch (const failed& e)
        {
          assert (e.kind == failure::corrupt);
        }
      }

      s.clear ();
    }

    // The lock is exclusive and released on destruction.
    //
    {
      {
        state_lock l (s.lock ());

        try
        {
          state_lock l2 (s.lock ());
          assert (false);
        }
        catch (const failed& e)
        {
          assert (e.kind == failure::state);
        }
      }

      state_lock l (s.lock ());
      assert (l.file () == s.directory () / lock_file);
    }

    return 0;
  }
}

int
main ()
{
  return prel::main ();
}
