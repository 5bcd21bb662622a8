// file      : nixrev/shell.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef NIXREV_SHELL_HXX
#define NIXREV_SHELL_HXX

#include <nixrev/types.hxx>
#include <nixrev/utility.hxx>

#include <nixrev/review.hxx>
#include <nixrev/common-options.hxx>

namespace nixrev
{
  // Return the shell.nix file contents that makes the packages available in
  // the shell.
  //
  string
  shell_expression (const attributes&);

  // Run nix-shell interactively with the shell.nix file written into the
  // temporary directory. The shell's exit status is ignored.
  //
  class nix_shell_launcher: public shell_launcher
  {
  public:
    explicit
    nix_shell_launcher (const common_options& o): options_ (o) {}

    virtual void
    launch (const attributes&) override;

  private:
    const common_options& options_;
  };
}

#endif // NIXREV_SHELL_HXX
