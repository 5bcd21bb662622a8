// file      : nixrev/utility.txx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <nixrev/diagnostics.hxx>

namespace nixrev
{
  template <typename I, typename O, typename E, typename P, typename... A>
  process
  start (I&& in, O&& out, E&& err, const P& prog, A&&... args)
  {
    try
    {
      return butl::process_start_callback (
        [] (const char* const args[], size_t n)
        {
          if (verb >= 2)
            print_process (args, n);
        },
        forward<I> (in),
        forward<O> (out),
        forward<E> (err),
        prog,
        forward<A> (args)...);
    }
    catch (const process_error& e)
    {
      fail << "unable to execute " << prog << ": " << e << endf;
    }
  }

  template <typename P>
  void
  finish (const P& prog, process& pr, bool io_read, bool io_write)
  {
    if (!pr.wait ())
    {
      const process_exit& e (*pr.exit);

      if (e.normal ())
        throw process_failed (); // Assume the child issued diagnostics.

      fail << "process " << prog << " " << e;
    }

    if (io_read)
      fail << "error reading " << prog << " output";

    if (io_write)
      fail << "error writing " << prog << " input";
  }

  template <typename P, typename... A>
  void
  run (const P& prog, A&&... args)
  {
    process pr (start (0 /* stdin  */,
                       1 /* stdout */,
                       2 /* stderr */,
                       prog,
                       forward<A> (args)...));

    finish (prog, pr);
  }

  template <typename P, typename... A>
  string
  run_output (const P& prog, A&&... args)
  {
    fdpipe pipe (open_pipe ());

    process pr (start (0    /* stdin  */,
                       pipe /* stdout */,
                       2    /* stderr */,
                       prog,
                       forward<A> (args)...));

    // Shouldn't throw, unless something is severely damaged.
    //
    pipe.out.close ();

    string r;
    bool io (false);
    try
    {
      ifdstream is (move (pipe.in), fdstream_mode::skip, ifdstream::badbit);

      r = is.read_text ();
      is.close (); // Detect errors.
    }
    catch (const io_error&)
    {
      // Presumably the child process failed and issued diagnostics so let
      // finish() try to deal with that.
      //
      io = true;
    }

    finish (prog, pr, io);

    if (!r.empty () && r.back () == '\n')
      r.pop_back ();

    return r;
  }

  template <typename C>
  bool
  parse_command (const char* cmd, C& r)
  {
    int argc (2);
    char* argv[] {const_cast<char*> (""), const_cast<char*> (cmd)};

    r.parse (argc, argv, true, cli::unknown_mode::stop);

    return argc == 1;
  }

  template <typename C>
  C
  parse_command (cli::scanner& scan, const char* what, const char* help)
  {
    // The next argument should be a command.
    //
    if (!scan.more ())
      fail << what << " expected" <<
        info << "run '" << help << "' for more information";

    const char* cmd (scan.next ());

    C r;
    if (parse_command (cmd, r))
      return r;

    fail << "unknown " << what << " '" << cmd << "'" <<
      info << "run '" << help << "' for more information" << endf;
  }
}
