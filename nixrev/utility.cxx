// file      : nixrev/utility.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <nixrev/utility.hxx>

#include <libbutl/process.hxx>
#include <libbutl/fdstream.hxx>

#include <nixrev/diagnostics.hxx>

using namespace std;
using namespace butl;

namespace nixrev
{
  dir_path temp_dir;

  void
  init_tmp ()
  {
    dir_path d (dir_path::temp_path ("nix-review"));

    if (exists (d))
      rm_r (d, true /* dir_itself */, 2);

    mk (d); // We shouldn't need mk_p().

    temp_dir = move (d);
  }

  void
  clean_tmp (bool ignore_error)
  {
    if (!temp_dir.empty () && exists (temp_dir, ignore_error))
    {
      rm_r (temp_dir,
            true /* dir_itself */,
            3,
            ignore_error ? rm_error_mode::ignore : rm_error_mode::fail);

      temp_dir.clear ();
    }
  }

  dir_path
  home_directory ()
  {
    try
    {
      return dir_path::home_directory ();
    }
    catch (const system_error& e)
    {
      fail << "unable to obtain home directory: " << e << endf;
    }
  }

  dir_path
  cache_directory ()
  {
    dir_path r;

    // Note that according to the XDG base directory specification a relative
    // path in $XDG_CACHE_HOME is invalid and should be ignored.
    //
    if (optional<string> v = getenv ("XDG_CACHE_HOME"))
    try
    {
      r = dir_path (move (*v));

      if (r.relative ())
        r.clear ();
    }
    catch (const invalid_path& e)
    {
      warn << "ignoring invalid XDG_CACHE_HOME value '" << e.path << "'";
    }

    if (r.empty ())
      r = home_directory () / dir_path (".cache");

    return r / dir_path ("nix-review");
  }

  bool
  exists (const path& f, bool ignore_error)
  {
    try
    {
      return file_exists (f, true /* follow_symlinks */, ignore_error);
    }
    catch (const system_error& e)
    {
      fail << "unable to stat path " << f << ": " << e << endf;
    }
  }

  bool
  exists (const dir_path& d, bool ignore_error)
  {
    try
    {
      return dir_exists (d, ignore_error);
    }
    catch (const system_error& e)
    {
      fail << "unable to stat path " << d << ": " << e << endf;
    }
  }

  void
  mk (const dir_path& d)
  {
    if (verb >= 3)
      text << "mkdir " << d;

    try
    {
      try_mkdir (d);
    }
    catch (const system_error& e)
    {
      fail << "unable to create directory " << d << ": " << e;
    }
  }

  void
  mk_p (const dir_path& d)
  {
    if (verb >= 3)
      text << "mkdir -p " << d;

    try
    {
      try_mkdir_p (d);
    }
    catch (const system_error& e)
    {
      fail << "unable to create directory " << d << ": " << e;
    }
  }

  void
  rm_r (const dir_path& d, bool dir, uint16_t v, rm_error_mode m)
  {
    if (verb >= v)
      text << (dir ? "rmdir -r " : "rm -r ") << (dir ? d : d / dir_path ("*"));

    try
    {
      rmdir_r (d, dir, m == rm_error_mode::ignore);
    }
    catch (const system_error& e)
    {
      bool w (m == rm_error_mode::warn);

      (w ? warn : error) << "unable to remove " << (dir ? "" : "contents of ")
                         << "directory " << d << ": " << e;

      if (!w)
        throw failed ();
    }
  }

  void
  write_file (const path& f, const string& s, const char* what)
  {
    if (verb >= 3)
      text << "write " << f;

    try
    {
      ofdstream os (f);
      auto_rmfile arm (f); // Try to remove on failure ignoring errors.

      os << s;
      os.close ();

      arm.cancel ();
    }
    catch (const system_error& e) // EACCES, etc.
    {
      fail << "unable to write " << what << ' ' << f << ": " << e;
    }
  }

  fdpipe
  open_pipe ()
  {
    try
    {
      return fdopen_pipe ();
    }
    catch (const io_error& e)
    {
      fail << "unable to open pipe: " << e << endf;
    }
  }

  auto_fd
  open_null ()
  {
    try
    {
      return fdopen_null ();
    }
    catch (const io_error& e)
    {
      fail << "unable to open null device: " << e << endf;
    }
  }

  strings
  split_words (const string& s)
  {
    strings r;

    for (size_t b (0), e (0); next_word (s, b, e); )
      r.push_back (string (s, b, e - b));

    return r;
  }
}
