// file      : nixrev/help.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef NIXREV_HELP_HXX
#define NIXREV_HELP_HXX

#include <nixrev/types.hxx>
#include <nixrev/utility.hxx>

#include <nixrev/help-options.hxx>

namespace nixrev
{
  using usage_function = cli::usage_para (ostream&, cli::usage_para);

  int
  help (const help_options&, const string& topic, usage_function* usage);
}

#endif // NIXREV_HELP_HXX
