// file      : nixrev/review.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef NIXREV_REVIEW_HXX
#define NIXREV_REVIEW_HXX

#include <nixrev/types.hxx>
#include <nixrev/utility.hxx>

#include <nixrev/diagnostics.hxx>
#include <nixrev/options-types.hxx>

namespace nixrev
{
  // The configuration for building a single change. The shared part is
  // filled from the command line options and the worktree is set for each
  // change.
  //
  struct review_request
  {
    dir_path         worktree;
    string           build_args;      // Raw, split into words when building.
    optional<string> token;           // GitHub access token.
    eval_source      eval = eval_source::ofborg;
    attributes       packages;        // Only build these if not empty.
    checkout_option  checkout = checkout_option::merge;
  };

  // Thrown by the build pipeline if a change fails to build. The diagnostics
  // is assumed to have already been issued (normally by the failed child
  // process).
  //
  class build_failed: public failed {};

  // An isolated checkout of nixpkgs for reviewing a single change. The
  // checkout is removed when the object is destroyed.
  //
  class workspace
  {
  public:
    virtual
    ~workspace () = default;

    virtual const dir_path&
    directory () const = 0;

    string
    nixpkgs_path () const;
  };

  class workspace_provider
  {
  public:
    virtual
    ~workspace_provider () = default;

    // Create a new workspace. The name is used as a prefix for the actual
    // (unique) workspace name.
    //
    virtual unique_ptr<workspace>
    acquire (const string& name) = 0;
  };

  class build_pipeline
  {
  public:
    virtual
    ~build_pipeline () = default;

    // Check out the pull request into the request's worktree, build the
    // packages it changes, and return their attributes. Throw build_failed
    // if any of the underlying steps fails.
    //
    virtual attributes
    build_pr (const review_request&, pr_number) = 0;

    // Review the local commit against the upstream branch in the request's
    // worktree, including starting the shell with the built packages.
    //
    virtual void
    review_commit (const review_request&,
                   const string& branch,
                   const string& commit) = 0;
  };

  // Start an interactive shell with the specified packages available. The
  // packages are looked up in <nixpkgs> as found via NIX_PATH.
  //
  class shell_launcher
  {
  public:
    virtual
    ~shell_launcher () = default;

    virtual void
    launch (const attributes&) = 0;
  };

  // Resolve a commit/tag/ref/branch name to the commit id. Fail if unable
  // to.
  //
  class commit_resolver
  {
  public:
    virtual
    ~commit_resolver () = default;

    virtual string
    resolve (const string& ref) = 0;
  };

  struct review_context
  {
    workspace_provider& workspaces;
    build_pipeline&     pipeline;
    shell_launcher&     shell;
  };

  // The upstream nixpkgs repository.
  //
  extern const char* const nixpkgs_repo;      // NixOS/nixpkgs
  extern const char* const nixpkgs_remote;    // https://github.com/NixOS/nixpkgs

  // Return the pull request URL that is printed for the user.
  //
  string
  pr_url (pr_number);

  // Return the NIX_PATH value that makes <nixpkgs> refer to the checkout.
  //
  string
  nixpkgs_path (const dir_path& checkout);

  // Set NIX_PATH to refer to the checkout.
  //
  // Note that this is the process-wide channel through which the shell
  // learns about the checkout and so it must only be changed right before
  // starting a shell, one shell at a time.
  //
  void
  set_nixpkgs_path (const dir_path& checkout);

  inline void
  set_nixpkgs_path (const workspace& w)
  {
    set_nixpkgs_path (w.directory ());
  }
}

#endif // NIXREV_REVIEW_HXX
