// file      : nixrev/buildenv.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef NIXREV_BUILDENV_HXX
#define NIXREV_BUILDENV_HXX

#include <nixrev/types.hxx>
#include <nixrev/utility.hxx>

namespace nixrev
{
  // The process-wide environment for building and reviewing changes.
  //
  // On construction, create the temporary directory (see temp_dir), write
  // the nixpkgs configuration that allows unfree, broken, and unsupported
  // packages into it, and point NIXPKGS_CONFIG to this file. On destruction,
  // restore the original values of the variables that we (or the review
  // commands) change and remove the temporary directory.
  //
  // Note that only one such environment can exist at a time.
  //
  class build_environment
  {
  public:
    build_environment ();
    ~build_environment ();

    build_environment (const build_environment&) = delete;
    build_environment& operator= (const build_environment&) = delete;

    const path&
    config () const {return config_;}

    // The variables that are saved and restored.
    //
    static const char* const variables[];

  private:
    void
    restore ();

  private:
    path config_;
    vector<pair<const char*, optional<string>>> saved_;
  };

  // Return the nixpkgs config.nix file contents.
  //
  string
  nixpkgs_config ();
}

#endif // NIXREV_BUILDENV_HXX
