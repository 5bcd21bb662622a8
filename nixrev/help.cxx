// file      : nixrev/help.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <nixrev/help.hxx>

#include <libbutl/pager.hxx>

#include <nixrev/diagnostics.hxx>
#include <nixrev/nixrev-options.hxx>

using namespace std;
using namespace butl;

namespace nixrev
{
  int
  help (const help_options& o, const string& t, usage_function* usage)
  {
    if (usage == nullptr) // Not a command.
    {
      if (t.empty ())             // General help.
        usage = &print_nix_review_usage;
      //
      // Help topics.
      //
      else if (t == "common-options")
        usage = &print_nix_review_common_options_long_usage;
      else
        fail << "unknown nix-review command/help topic '" << t << "'" <<
          info << "run 'nix-review help' for more information";
    }

    try
    {
      pager p ("nix-review " + (t.empty () ? "help" : t),
               verb >= 2,
               o.pager_specified () ? &o.pager () : nullptr,
               &o.pager_option ());

      usage (p.stream (), cli::usage_para::none);

      // If the pager failed, assume it has issued some diagnostics.
      //
      return p.wait () ? 0 : 1;
    }
    // Catch io_error as std::system_error together with the pager-specific
    // exceptions.
    //
    catch (const system_error& e)
    {
      error << "pager failed: " << e;

      // Fall through.
    }

    throw failed ();
  }
}
