// file      : prel/status.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef PREL_STATUS_HXX
#define PREL_STATUS_HXX

#include <prel/types.hxx>
#include <prel/utility.hxx>

#include <prel/repository.hxx>
#include <prel/state-store.hxx>

#include <prel/prel-options.hxx>

namespace prel
{
  // Print the release attempt report to the stream in the --stdout-format
  // format. Never changes the record or the repository. Return
  // exit_in_progress if a release is in progress and exit_success
  // otherwise.
  //
  int
  cmd_status (const options&, repository&, const state_store&, ostream&);
}

#endif // PREL_STATUS_HXX
