// file      : nixrev/nixrev.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef _WIN32
#  include <signal.h> // signal()
#endif

#include <cstring>     // strcmp()
#include <cerrno>      // errno
#include <iostream>
#include <exception>   // set_terminate(), terminate_handler

#include <libbutl/backtrace.hxx> // backtrace()

#include <nixrev/types.hxx>
#include <nixrev/utility.hxx>

#include <nixrev/buildenv.hxx>
#include <nixrev/diagnostics.hxx>
#include <nixrev/nixrev-options.hxx>

// Commands.
//
#include <nixrev/help.hxx>

#include <nixrev/pr.hxx>
#include <nixrev/rev.hxx>

using namespace std;
using namespace butl;
using namespace nixrev;

namespace nixrev
{
  int
  main (int argc, char* argv[]);
}

// Initialize the command option class O with the common options and then
// parse the rest of the command line placing non-option arguments to args.
// Once this is done, use the "final" values of the common options to do
// global initializations (verbosity level, etc).
//
template <typename O>
static O
init (const common_options& co,
      cli::scanner& scan,
      strings& args,
      bool keep_sep)
{
  O o;
  static_cast<common_options&> (o) = co;

  // We want to be able to specify options and arguments in any order (it is
  // really handy to just add -v at the end of the command line).
  //
  for (bool opt (true); scan.more (); )
  {
    if (opt)
    {
      // If we see first "--", then we are done parsing options.
      //
      if (strcmp (scan.peek (), "--") == 0)
      {
        if (!keep_sep)
          scan.next ();

        opt = false;
        continue;
      }

      // Parse the next chunk of options until we reach an argument (or eos).
      //
      if (o.parse (scan) && !scan.more ())
        break;

      // Fall through.
    }

    args.push_back (scan.next ());
  }

  // Global initializations.
  //

  // Diagnostics verbosity.
  //
  verb = o.verbose_specified ()
         ? o.verbose ()
         : o.V () ? 3 : o.v () ? 2 : o.quiet () ? 0 : 1;

  return o;
}

// Print backtrace if terminating due to an unhandled exception. Note that
// custom_terminate is non-static and not a lambda to reduce the noise.
//
static terminate_handler default_terminate;

void
custom_terminate ()
{
  *diag_stream << backtrace ();

  if (default_terminate != nullptr)
    default_terminate ();
}

int nixrev::
main (int argc, char* argv[])
try
{
  using namespace cli;

  default_terminate = set_terminate (custom_terminate);

  // On POSIX ignore SIGPIPE which is signaled to a pipe-writing process if
  // the pipe reading end is closed. Note that by default this signal
  // terminates a process. Also note that there is no way to disable this
  // behavior on a file descriptor basis or for the write() function call.
  //
#ifndef _WIN32
  if (signal (SIGPIPE, SIG_IGN) == SIG_ERR)
    fail << "unable to ignore broken pipe (SIGPIPE) signal: "
         << system_error (errno, generic_category ()); // Sanitize.
#endif

  argv_scanner scan (argc, argv);

  // First parse common options and --version/--help.
  //
  nixrev::options o;
  o.parse (scan, unknown_mode::stop);

  if (o.version ())
  {
    cout << "nix-review " << NIXREV_VERSION_ID << endl
         << "libbutl " << LIBBUTL_VERSION_ID << endl
         << "Copyright (c) " << NIXREV_COPYRIGHT << "." << endl
         << "This is free software released under the MIT license." << endl;
    return 0;
  }

  strings argsv; // To be filled by init() above.
  vector_scanner args (argsv);

  const common_options& co (o);

  if (o.help ())
    return help (init<help_options> (co, scan, argsv, false /* keep_sep */),
                 "",
                 nullptr);

  // The next argument should be a command.
  //
  commands cmd (parse_command<commands> (scan,
                                         "nix-review command",
                                         "nix-review help"));

  // If the command is 'help', then what's coming next is another command.
  // Parse it into cmd so that we only need to check for each command in one
  // place.
  //
  bool h (cmd.help ());
  help_options ho;

  if (h)
  {
    ho = init<help_options> (co, scan, argsv, false /* keep_sep */);

    if (args.more ())
    {
      const char* a (args.next ());

      cmd = commands (); // Clear the help option.

      // If not a command, then it got to be a help topic.
      //
      if (!parse_command (a, cmd))
        return help (ho, a, nullptr);
    }
    else
      return help (ho, "", nullptr);
  }

  // Handle commands.
  //
  int r (1);
  for (;;) // Breakout loop.
  try
  {
    // help
    //
    if (cmd.help ())
    {
      assert (h);
      r = help (ho, "help", print_nix_review_help_usage);
      break;
    }

    // Commands.
    //
    // The review commands run in the build environment which is set up after
    // parsing the command line and torn down before returning from the
    // command.
    //
    // if (cmd.pr ())
    // {
    //  if (h)
    //    r = help (ho, "pr", print_nix_review_pr_usage);
    //  else
    //  {
    //    cmd_pr_options co (init<cmd_pr_options> (...));
    //    build_environment env;
    //    r = cmd_pr (co, args);
    //  }
    //
    //  break;
    // }
    //
#define COMMAND_IMPL(ON, FN, SN, SEP)                         \
    if (cmd.ON ())                                            \
    {                                                         \
      if (h)                                                  \
        r = help (ho, SN, print_nix_review_##FN##_usage);     \
      else                                                    \
      {                                                       \
        cmd_##FN##_options fo (                               \
          init<cmd_##FN##_options> (co, scan, argsv, SEP));   \
                                                              \
        build_environment env;                                \
        r = cmd_##FN (fo, args);                              \
      }                                                       \
                                                              \
      break;                                                  \
    }

    COMMAND_IMPL (pr,  pr,  "pr",  false);
    COMMAND_IMPL (rev, rev, "rev", false);

    assert (false);
    fail << "unhandled command";
  }
  catch (const failed&)
  {
    r = 1;
    break;
  }

  if (r != 0)
    return r;

  // Warn if args contain some leftover junk. We already successfully
  // performed the command so failing would probably be misleading.
  //
  if (args.more ())
  {
    diag_record dr;
    dr << warn << "ignoring unexpected argument(s)";
    while (args.more ())
      dr << " '" << args.next () << "'";
  }

  return 0;
}
catch (const failed&)
{
  return 1; // Diagnostics has already been issued.
}
catch (const cli::exception& e)
{
  error << e;
  return 1;
}

int
main (int argc, char* argv[])
{
  return nixrev::main (argc, argv);
}
