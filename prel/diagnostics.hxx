// file      : prel/diagnostics.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef PREL_DIAGNOSTICS_HXX
#define PREL_DIAGNOSTICS_HXX

#include <utility> // move(), forward()

#include <libbutl/diagnostics.hxx>

#include <prel/types.hxx> // Note: not <prel/utility.hxx>

namespace prel
{
  using butl::diag_record;

  // Failure kinds. Each maps to a distinct process exit code so that the
  // callers (scripts, CI) can branch on the outcome without parsing the
  // diagnostics.
  //
  enum class failure
  {
    internal, // Internal error.
    adapter,  // Underlying version control operation failed.
    config,   // Invalid configuration or command line.
    state,    // Invalid repository state.
    conflict, // Merge conflicts need resolution.
    version,  // Invalid or non-advancing version.
    corrupt   // Unreadable release attempt record.
  };

  // Process exit codes.
  //
  const int exit_success     = 0;
  const int exit_internal    = 1; // Also adapter.
  const int exit_conflict    = 2;
  const int exit_state       = 3;
  const int exit_config      = 4;
  const int exit_version     = 5;
  const int exit_corrupt     = 6;
  const int exit_in_progress = 10; // --status only.

  int
  exit_code (failure);

  ostream&
  operator<< (ostream&, failure);

  // Throw this exception to terminate the process. The handler should
  // assume that the diagnostics has already been issued.
  //
  class failed: public std::exception
  {
  public:
    explicit
    failed (failure k = failure::internal): kind (k) {}

    failure kind;
  };

  // Print process commmand line. If the number of elements is specified
  // (or the second version is used), then it will print the piped multi-
  // process command line, if present. In this case, the expected format
  // is as follows:
  //
  // name1 arg arg ... nullptr
  // name2 arg arg ... nullptr
  // ...
  // nameN arg arg ... nullptr nullptr
  //
  void
  print_process (diag_record&, const char* const args[], size_t n = 0);

  void
  print_process (const char* const args[], size_t n = 0);

  // Verbosity level. Update documentation for --verbose if changing.
  //
  // 0 - disabled
  // 1 - high-level information messages
  // 2 - essential underlying commands that are being executed
  // 3 - all underlying commands that are being executed
  // 4 - information that could be helpful to the user
  // 5 - information that could be helpful to the developer
  // 6 - even more detailed information
  //
  // While uint8 is more than enough, use uint16 for the ease of printing.
  //
  extern uint16_t verb;

  template <typename F> inline void l4 (const F& f) {if (verb >= 4) f ();}

  // Diagnostic facility, base infrastructure.
  //
  using butl::diag_stream;
  using butl::diag_epilogue;

  // Diagnostic facility, project specifics.
  //
  struct simple_prologue_base
  {
    explicit
    simple_prologue_base (const char* type, const char* name)
        : type_ (type), name_ (name) {}

    void
    operator() (const diag_record& r) const;

  private:
    const char* type_;
    const char* name_;
  };

  class location
  {
  public:
    // Zero lines or columns are not printed.
    //
    explicit
    location (string f, uint64_t l = 0, uint64_t c = 0)
        : file (std::move (f)), line (l), column (c) {}

    location () = default;

    bool
    empty () const {return file.empty ();}

    string file;
    uint64_t line;
    uint64_t column;
  };

  struct location_prologue_base
  {
    location_prologue_base (const char* type,
                            const char* name,
                            const location& l)
        : type_ (type), name_ (name), loc_ (l) {}

    location_prologue_base (const char* type,
                            const char* name,
                            const path& f)
        : type_ (type), name_ (name), loc_ (f.string ()) {}

    void
    operator() (const diag_record& r) const;

  private:
    const char* type_;
    const char* name_;
    const location loc_;
  };

  struct basic_mark_base
  {
    using simple_prologue   = butl::diag_prologue<simple_prologue_base>;
    using location_prologue = butl::diag_prologue<location_prologue_base>;

    explicit
    basic_mark_base (const char* type,
                     const char* name = nullptr,
                     const void* data = nullptr,
                     diag_epilogue* epilogue = nullptr)
        : type_ (type), name_ (name), data_ (data), epilogue_ (epilogue) {}

    simple_prologue
    operator() () const
    {
      return simple_prologue (epilogue_, type_, name_);
    }

    location_prologue
    operator() (const location& l) const
    {
      return location_prologue (epilogue_, type_, name_, l);
    }

    location_prologue
    operator() (const path& f) const
    {
      return location_prologue (epilogue_, type_, name_, f);
    }

    template <typename F, typename L, typename C>
    location_prologue
    operator() (F&& f, L&& l, C&& c) const
    {
      return location_prologue (
        epilogue_,
        type_,
        name_,
        location (std::forward<F> (f),
                  std::forward<L> (l),
                  std::forward<C> (c)));
    }

  protected:
    const char* type_;
    const char* name_;
    const void* data_;
    diag_epilogue* const epilogue_;
  };
  using basic_mark = butl::diag_mark<basic_mark_base>;

  extern const basic_mark error;
  extern const basic_mark warn;
  extern const basic_mark info;
  extern const basic_mark text;

  // trace
  //
  struct trace_mark_base: basic_mark_base
  {
    explicit
    trace_mark_base (const char* name, const void* data = nullptr)
        : basic_mark_base ("trace", name, data) {}
  };
  using trace_mark = butl::diag_mark<trace_mark_base>;

  using tracer = trace_mark;

  // fail
  //
  // The failure kind is part of the mark type so that the epilogue (which
  // cannot capture) knows what to throw.
  //
  template <failure K>
  struct fail_mark_base: basic_mark_base
  {
    explicit
    fail_mark_base (const char* type, const void* data = nullptr)
        : basic_mark_base (type,
                           nullptr,
                           data,
                           [](const diag_record& r, butl::diag_writer* w)
                           {
                             r.flush (w);
                             throw failed (K);
                           }) {}
  };

  template <failure K>
  using fail_mark = butl::diag_mark<fail_mark_base<K>>;

  // Note that the record is flushed via the mark's epilogue which throws the
  // failure of the corresponding kind. So the throw below is only reached for
  // records without an epilogue.
  //
  struct fail_end_base
  {
    [[noreturn]] void
    operator() (const diag_record& r) const
    {
      // If we just throw then the record's destructor will see an active
      // exception and will not flush the record.
      //
      r.flush ();
      throw failed ();
    }
  };
  using fail_end = butl::diag_noreturn_end<fail_end_base>;

  extern const fail_mark<failure::internal> fail;
  extern const fail_mark<failure::adapter>  fail_adapter;
  extern const fail_mark<failure::config>   fail_config;
  extern const fail_mark<failure::state>    fail_state;
  extern const fail_mark<failure::conflict> fail_conflict;
  extern const fail_mark<failure::version>  fail_version;
  extern const fail_mark<failure::corrupt>  fail_corrupt;
  extern const fail_end                     endf;
}

#endif // PREL_DIAGNOSTICS_HXX
