// file      : nixrev/git.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef NIXREV_GIT_HXX
#define NIXREV_GIT_HXX

#include <libbutl/git.hxx>

#include <nixrev/types.hxx>
#include <nixrev/utility.hxx>

namespace nixrev
{
  // All functions that start git process take the minimum supported git
  // version as an argument.
  //
  // Start git process.
  //
  template <typename I, typename O, typename E, typename... A>
  process
  start_git (const semantic_version&,
             I&& in, O&& out, E&& err,
             A&&... args);

  // Wait for git process to terminate failing if it didn't exit normally
  // with the zero status.
  //
  inline void
  finish_git (process& pr, bool io_read = false)
  {
    finish ("git", pr, io_read);
  }

  // Run git process.
  //
  // Pass NULL as the repository argument to run git in the current working
  // directory. If progress is false, then git's stderr is proxied through
  // our diagnostics stream which makes git suppress its progress output.
  //
  template <typename... A>
  void
  run_git (const semantic_version&,
           bool progress,
           const dir_path* repo,
           A&&... args);

  template <typename... A>
  inline void
  run_git (const semantic_version& min_ver,
           const dir_path& repo,
           A&&... args)
  {
    run_git (min_ver, true /* progress */, &repo, forward<A> (args)...);
  }

  // Return the first line of the git output. If ignore_error is true, then
  // suppress stderr, ignore (normal) error exit status, and return nullopt.
  //
  template <typename... A>
  optional<string>
  git_line (const semantic_version&, bool ignore_error, A&&... args);

  // Similar to the above but takes the already started git process with a
  // redirected output pipe.
  //
  optional<string>
  git_line (process&&, fdpipe&&, bool ignore_error, char delim = '\n');

  // Resolve a commit/tag/ref/branch to the commit id. Issue diagnostics and
  // fail if the name does not refer to a valid object.
  //
  string
  git_rev_parse (const string& ref);

  // Fetch the refs from the remote repository URL into the repository in the
  // current working directory and return the fetched commit ids (in the refs
  // order).
  //
  strings
  git_fetch (const string& remote, const strings& refs);

  // Add a detached worktree for the specified commit.
  //
  void
  git_worktree_add (const dir_path& worktree, const string& commit);

  // Merge the commit into the worktree without committing the result.
  //
  void
  git_merge (const dir_path& worktree, const string& commit);

  // Check out the commit in the worktree (detaching the HEAD).
  //
  void
  git_checkout (const dir_path& worktree, const string& commit);

  // Prune the stale worktree administrative data. Issue a warning rather than
  // fail on error.
  //
  void
  git_worktree_prune ();

  // Return true if git is at least of the specified minimum supported
  // version.
  //
  bool
  git_try_check_version (const semantic_version&);
}

#include <nixrev/git.txx>

#endif // NIXREV_GIT_HXX
