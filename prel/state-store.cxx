// file      : prel/state-store.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <prel/state-store.hxx>

#ifndef _WIN32
#  include <sys/file.h> // flock()

#  include <cerrno>
#else
#  include <libbutl/win32-utility.hxx>

#  include <io.h> // _get_osfhandle()
#endif

#include <prel/diagnostics.hxx>

using namespace std;
using namespace butl;

namespace prel
{
  // state_lock
  //
  state_lock::
  state_lock (const path& f)
      : file_ (f)
  {
    tracer trace ("state_lock");

    try
    {
      fd_ = fdopen (f, fdopen_mode::out | fdopen_mode::create);
    }
    catch (const io_error& e)
    {
      fail << "unable to open lock file " << f << ": " << e;
    }

#ifndef _WIN32
    if (flock (fd_.get (), LOCK_EX | LOCK_NB) != 0)
    {
      int e (errno);

      if (e == EWOULDBLOCK)
        fail_state << "release attempt is locked by another process" <<
          info << "lock file: " << f;

      fail << "unable to lock " << f << ": "
           << system_error (e, generic_category ());
    }
#else
    OVERLAPPED ov {};
    HANDLE h (reinterpret_cast<HANDLE> (_get_osfhandle (fd_.get ())));

    if (!LockFileEx (h,
                     LOCKFILE_EXCLUSIVE_LOCK | LOCKFILE_FAIL_IMMEDIATELY,
                     0,
                     MAXDWORD,
                     MAXDWORD,
                     &ov))
    {
      DWORD e (GetLastError ());

      if (e == ERROR_LOCK_VIOLATION)
        fail_state << "release attempt is locked by another process" <<
          info << "lock file: " << f;

      fail << "unable to lock " << f << ": " << win32::error_msg (e);
    }
#endif

    l4 ([&]{trace << "locked " << f;});
  }

  // state_store
  //
  state_store::
  state_store (dir_path d)
      : dir_ (move (d))
  {
  }

  optional<release_attempt> state_store::
  load () const
  {
    path f (file ());

    if (!exists (f))
      return nullopt;

    return parse_manifest<release_attempt> (f, "release attempt");
  }

  void state_store::
  save (const release_attempt& a)
  {
    tracer trace ("state_store::save");

    mk_p (dir_);

    path f (file ());
    path t (f + ".tmp");

    serialize_manifest (a, t, "release attempt");
    mv (t, f);

    l4 ([&]{trace << "saved " << a.phase << " to " << f;});
  }

  void state_store::
  clear ()
  {
    path f (file ());

    if (exists (f))
      rm (f);
  }

  state_lock state_store::
  lock ()
  {
    mk_p (dir_);
    return state_lock (dir_ / lock_file);
  }
}
