// file      : nixrev/worktree.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef NIXREV_WORKTREE_HXX
#define NIXREV_WORKTREE_HXX

#include <nixrev/types.hxx>
#include <nixrev/utility.hxx>

#include <nixrev/review.hxx>

namespace nixrev
{
  // A git worktree directory in the per-user cache directory. The directory
  // is created empty (it is populated by git-worktree-add(1)) and on
  // destruction is removed together with git's administrative data about
  // it. Errors during the removal are reported as warnings.
  //
  class worktree: public workspace
  {
  public:
    explicit
    worktree (dir_path);

    ~worktree () override;

    virtual const dir_path&
    directory () const override {return dir_;}

    worktree (const worktree&) = delete;
    worktree& operator= (const worktree&) = delete;

  private:
    dir_path dir_;
  };

  // Create worktrees in <cache>/nix-review/ with the <name>-<pid>-<n> names,
  // where <n> is the first number that gives a directory that does not yet
  // exist.
  //
  class worktree_provider: public workspace_provider
  {
  public:
    virtual unique_ptr<workspace>
    acquire (const string& name) override;
  };
}

#endif // NIXREV_WORKTREE_HXX
