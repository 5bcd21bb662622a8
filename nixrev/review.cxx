// file      : nixrev/review.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <nixrev/review.hxx>

using namespace std;

namespace nixrev
{
  const char* const nixpkgs_repo   ("NixOS/nixpkgs");
  const char* const nixpkgs_remote ("https://github.com/NixOS/nixpkgs");

  string
  nixpkgs_path (const dir_path& d)
  {
    return "nixpkgs=" + d.string ();
  }

  string workspace::
  nixpkgs_path () const
  {
    return nixrev::nixpkgs_path (directory ());
  }

  string
  pr_url (pr_number n)
  {
    return string (nixpkgs_remote) + "/pull/" + to_string (n);
  }

  void
  set_nixpkgs_path (const dir_path& d)
  {
    tracer trace ("set_nixpkgs_path");

    string v (nixpkgs_path (d));

    l4 ([&]{trace << "NIX_PATH=" << v;});

    try
    {
      setenv ("NIX_PATH", v);
    }
    catch (const system_error& e)
    {
      fail << "unable to set NIX_PATH environment variable: " << e;
    }
  }
}
