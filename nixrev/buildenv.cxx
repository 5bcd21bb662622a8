// file      : nixrev/buildenv.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <nixrev/buildenv.hxx>

#include <nixrev/diagnostics.hxx>

using namespace std;

namespace nixrev
{
  const char* const build_environment::variables[] = {
    "NIXPKGS_CONFIG",
    "NIX_PATH",
    nullptr};

  string
  nixpkgs_config ()
  {
    return "{\n"
           "  allowUnfree = true;\n"
           "  allowBroken = true;\n"
           "  allowUnsupportedSystem = true;\n"
           "}\n";
  }

  build_environment::
  build_environment ()
  {
    tracer trace ("build_environment");

    for (const char* const* v (variables); *v != nullptr; ++v)
      saved_.emplace_back (*v, getenv (*v));

    init_tmp ();

    // Clean up if anything below fails since the destructor won't be
    // called.
    //
    auto g (make_exception_guard ([this] ()
    {
      restore ();
      clean_tmp (true /* ignore_error */);
    }));

    config_ = temp_dir / "config.nix";
    write_file (config_, nixpkgs_config (), "nixpkgs configuration");

    try
    {
      setenv ("NIXPKGS_CONFIG", config_.string ());
    }
    catch (const system_error& e)
    {
      fail << "unable to set NIXPKGS_CONFIG environment variable: " << e;
    }

    l4 ([&]{trace << "NIXPKGS_CONFIG=" << config_;});
  }

  build_environment::
  ~build_environment ()
  {
    restore ();
    clean_tmp (true /* ignore_error */);
  }

  void build_environment::
  restore ()
  {
    for (const auto& v: saved_)
    try
    {
      if (v.second)
        setenv (v.first, *v.second);
      else
        unsetenv (v.first);
    }
    catch (const system_error& e)
    {
      warn << "unable to restore " << v.first << " environment variable: "
           << e;
    }
  }
}
