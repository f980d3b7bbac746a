// file      : prel/state-store.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef PREL_STATE_STORE_HXX
#define PREL_STATE_STORE_HXX

#include <prel/types.hxx>
#include <prel/utility.hxx>

#include <prel/attempt.hxx>

namespace prel
{
  // Exclusive advisory lock on a file, released on destruction. Fail
  // (invalid repository state) if the lock is held by someone else. Never
  // waits.
  //
  class state_lock
  {
  public:
    explicit
    state_lock (const path&);

    state_lock (state_lock&&) = default;
    state_lock& operator= (state_lock&&) = default;

    state_lock (const state_lock&) = delete;
    state_lock& operator= (const state_lock&) = delete;

    const path&
    file () const {return file_;}

  private:
    path file_;
    auto_fd fd_;
  };

  // Release attempt record storage in the specified directory (normally
  // <git-dir>/prel/).
  //
  class state_store
  {
  public:
    explicit
    state_store (dir_path);

    const dir_path&
    directory () const {return dir_;}

    path
    file () const {return dir_ / attempt_file;}

    // Return nullopt if there is no record. Fail (corrupt record) if the
    // record cannot be parsed.
    //
    optional<release_attempt>
    load () const;

    // Atomically replace the record (write to a temporary file and rename it
    // over the record).
    //
    void
    save (const release_attempt&);

    // Remove the record if present.
    //
    void
    clear ();

    state_lock
    lock ();

  private:
    dir_path dir_;
  };
}

#endif // PREL_STATE_STORE_HXX
