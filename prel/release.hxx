// file      : prel/release.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef PREL_RELEASE_HXX
#define PREL_RELEASE_HXX

#include <prel/types.hxx>
#include <prel/utility.hxx>

#include <prel/machine.hxx>
#include <prel/repository.hxx>
#include <prel/state-store.hxx>

#include <prel/prel-options.hxx>

namespace prel
{
  // Start or advance (run, edit, continue) or cancel (abort) the release
  // attempt. The caller is expected to hold the state store lock. Return
  // the process exit code or throw failed.
  //
  int
  cmd_release (const options&, command, repository&, state_store&);

  // Messages and names derived from the configured formats. Fail
  // (configuration error) if a format is invalid.
  //
  string
  merge_message (const options&,
                 const string& source_branch,
                 const string& target_branch);

  string
  bump_message (const options&, const string& version);

  // The bump message subject (first line) as reported by the repository.
  //
  string
  bump_subject (const options&, const string& version);

  string
  tag_name (const options&, const string& version);

  string
  tag_message (const options&, const string& version);
}

#endif // PREL_RELEASE_HXX
