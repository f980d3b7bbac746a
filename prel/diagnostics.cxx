// file      : prel/diagnostics.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <prel/diagnostics.hxx>

#include <libbutl/process.hxx>
#include <libbutl/process-io.hxx> // operator<<(ostream, process_arg)

#include <prel/utility.hxx>

using namespace std;
using namespace butl;

namespace prel
{
  int
  exit_code (failure f)
  {
    switch (f)
    {
    case failure::internal:
    case failure::adapter:  return exit_internal;
    case failure::config:   return exit_config;
    case failure::state:    return exit_state;
    case failure::conflict: return exit_conflict;
    case failure::version:  return exit_version;
    case failure::corrupt:  return exit_corrupt;
    }

    return exit_internal;
  }

  ostream&
  operator<< (ostream& os, failure f)
  {
    switch (f)
    {
    case failure::internal: return os << "internal error";
    case failure::adapter:  return os << "version control error";
    case failure::config:   return os << "configuration error";
    case failure::state:    return os << "invalid repository state";
    case failure::conflict: return os << "merge conflict";
    case failure::version:  return os << "version error";
    case failure::corrupt:  return os << "corrupt release attempt record";
    }

    return os;
  }

  // print_process
  //
  void
  print_process (const char* const args[], size_t n)
  {
    diag_record r (text);
    print_process (r, args, n);
  }

  void
  print_process (diag_record& r, const char* const args[], size_t n)
  {
    r << process_args {args, n};
  }

  // Diagnostics verbosity level.
  //
  uint16_t verb = 1;

  // Diagnostic facility, project specifics.
  //

  void simple_prologue_base::
  operator() (const diag_record& r) const
  {
    if (type_ != nullptr)
      r << type_ << ": ";

    if (name_ != nullptr)
      r << name_ << ": ";
  }

  void location_prologue_base::
  operator() (const diag_record& r) const
  {
    if (!loc_.empty ())
    {
      r << loc_.file << ':';

      if (loc_.line != 0)
      {
        r << loc_.line << ':';

        if (loc_.column != 0)
          r << loc_.column << ':';
      }

      r << ' ';
    }

    if (type_ != nullptr)
      r << type_ << ": ";

    if (name_ != nullptr)
      r << name_ << ": ";
  }

  const basic_mark error ("error");
  const basic_mark warn  ("warning");
  const basic_mark info  ("info");
  const basic_mark text  (nullptr);

  const fail_mark<failure::internal> fail          ("error");
  const fail_mark<failure::adapter>  fail_adapter  ("error");
  const fail_mark<failure::config>   fail_config   ("error");
  const fail_mark<failure::state>    fail_state    ("error");
  const fail_mark<failure::conflict> fail_conflict ("error");
  const fail_mark<failure::version>  fail_version  ("error");
  const fail_mark<failure::corrupt>  fail_corrupt  ("error");
  const fail_end                     endf;
}
