// file      : nixrev/utility.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef NIXREV_UTILITY_HXX
#define NIXREV_UTILITY_HXX

#include <string>    // to_string()
#include <utility>   // move(), forward()
#include <cassert>   // assert()
#include <algorithm> // find(), count()

#include <libbutl/ft/lang.hxx>

#include <libbutl/utility.hxx>         // icasecmp(), reverse_iterate(), etc
#include <libbutl/fdstream.hxx>
#include <libbutl/filesystem.hxx>

#include <nixrev/types.hxx>
#include <nixrev/version.hxx>
#include <nixrev/common-options.hxx>

namespace nixrev
{
  using std::move;
  using std::forward;

  using std::to_string;

  using std::find;
  using std::count;

  // <libbutl/utility.hxx>
  //
  using butl::lcase;
  using butl::icasecmp;

  using butl::digit;

  using butl::next_word;

  using butl::make_guard;
  using butl::make_exception_guard;

  using butl::getenv;
  using butl::setenv;
  using butl::unsetenv;

  // <libbutl/filesystem.hxx>
  //
  using butl::auto_rmfile;

  // Temporary directory facility.
  //
  // This is a private system-wide directory (e.g., /tmp/nix-review-XXX/)
  // that is created and cleaned up by the build environment scope (see
  // buildenv.hxx) for the duration of the command.
  //
  extern dir_path temp_dir;

  void
  init_tmp ();

  void
  clean_tmp (bool ignore_errors);

  // Path.
  //
  dir_path
  home_directory ();

  // Return the per-user cache directory for this program, that is,
  // $XDG_CACHE_HOME/nix-review/ or ~/.cache/nix-review/ if the variable is
  // not set. The directory is not created.
  //
  dir_path
  cache_directory ();

  // Filesystem.
  //
  bool
  exists (const path&, bool ignore_error = false);

  bool
  exists (const dir_path&, bool ignore_error = false);

  void
  mk (const dir_path&);

  void
  mk_p (const dir_path&);

  enum class rm_error_mode {ignore, warn, fail};

  void
  rm_r (const dir_path&,
        bool dir_itself = true,
        uint16_t verbosity = 3,
        rm_error_mode = rm_error_mode::fail);

  // Write the string to the file, overwriting it if it exists. Issue
  // diagnostics and fail on error.
  //
  void
  write_file (const path&, const string& content, const char* what);

  // File descriptor streams.
  //
  fdpipe
  open_pipe ();

  auto_fd
  open_null ();

  // Run a process.
  //
  // Note that finish() throws process_failed if the process exits normally
  // with a non-zero status and fails if it terminates abnormally.
  //
  template <typename I, typename O, typename E, typename P, typename... A>
  process
  start (I&& in, O&& out, E&& err, const P& prog, A&&... args);

  template <typename P>
  void
  finish (const P& prog, process&, bool io_read = false, bool io_write = false);

  template <typename P, typename... A>
  void
  run (const P& prog, A&&... args);

  // Run a process and return its complete output (with the trailing newline
  // stripped). Issue diagnostics and fail on the output reading error.
  //
  template <typename P, typename... A>
  string
  run_output (const P& prog, A&&... args);

  // Split the string into whitespace-separated words.
  //
  strings
  split_words (const string&);

  // CLI (sub)command parsing helper.
  //
  template <typename C>
  C
  parse_command (cli::scanner& scan, const char* what, const char* help);

  template <typename C>
  bool
  parse_command (const char* cmd, C&);
}

#include <nixrev/utility.txx>

#endif // NIXREV_UTILITY_HXX
