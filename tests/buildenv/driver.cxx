// file      : tests/buildenv/driver.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <nixrev/types.hxx>
#include <nixrev/utility.hxx>

#include <nixrev/buildenv.hxx>
#include <nixrev/diagnostics.hxx>

#undef NDEBUG
#include <cassert>

using namespace std;
using namespace nixrev;

static string
read_file (const path& f)
{
  ifdstream is (f);
  string r (is.read_text ());
  is.close ();
  return r;
}

int
main ()
{
  verb = 0;

  setenv ("NIXPKGS_CONFIG", "/etc/nixpkgs-config.nix");
  unsetenv ("NIX_PATH");

  // Normal exit.
  //
  {
    dir_path d;
    {
      build_environment env;

      d = temp_dir;
      assert (!d.empty () && exists (d));

      const path& c (env.config ());
      assert (c.directory () == d);
      assert (exists (c));
      assert (read_file (c) == nixpkgs_config ());

      optional<string> v (getenv ("NIXPKGS_CONFIG"));
      assert (v && *v == c.string ());

      // Changed by the review commands.
      //
      setenv ("NIX_PATH", "nixpkgs=/tmp/checkout");
    }

    optional<string> v (getenv ("NIXPKGS_CONFIG"));
    assert (v && *v == "/etc/nixpkgs-config.nix");
    assert (!getenv ("NIX_PATH"));

    assert (temp_dir.empty ());
    assert (!exists (d));
  }

  // Exceptional exit.
  //
  {
    setenv ("NIX_PATH", "nixpkgs=/nix/var/channels/nixpkgs");
    unsetenv ("NIXPKGS_CONFIG");

    dir_path d;
    try
    {
      build_environment env;
      d = temp_dir;

      setenv ("NIX_PATH", "nixpkgs=/tmp/checkout");
      throw failed ();
    }
    catch (const failed&)
    {
    }

    optional<string> v (getenv ("NIX_PATH"));
    assert (v && *v == "nixpkgs=/nix/var/channels/nixpkgs");
    assert (!getenv ("NIXPKGS_CONFIG"));

    assert (!d.empty () && !exists (d));
  }

  // The configuration allows everything we may need to build.
  //
  {
    string c (nixpkgs_config ());
    assert (c.find ("allowUnfree = true;") != string::npos);
    assert (c.find ("allowBroken = true;") != string::npos);
    assert (c.find ("allowUnsupportedSystem = true;") != string::npos);
  }
}
