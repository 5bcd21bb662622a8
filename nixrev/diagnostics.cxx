// file      : nixrev/diagnostics.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <nixrev/diagnostics.hxx>

#include <libbutl/process.hxx>
#include <libbutl/process-io.hxx> // operator<<(ostream, process_arg)

using namespace std;
using namespace butl;

namespace nixrev
{
  uint16_t verb = 1;

  const basic_mark error ("error");
  const basic_mark warn  ("warning");
  const basic_mark info  ("info");
  const basic_mark text  (nullptr);
  const fail_mark  fail  ("error");
  const fail_end   endf;

  void simple_prologue_base::
  operator() (const diag_record& r) const
  {
    if (type_ != nullptr)
      r << type_ << ": ";

    if (name_ != nullptr)
      r << name_ << ": ";
  }

  void
  print_process (diag_record& r, const char* const args[], size_t n)
  {
    r << process_args {args, n};
  }

  void
  print_process (const char* const args[], size_t n)
  {
    diag_record r (text);
    r << process_args {args, n};
  }
}
