// file      : nixrev/worktree.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <nixrev/worktree.hxx>

#include <libbutl/filesystem.hxx> // try_mkdir()

#include <nixrev/git.hxx>
#include <nixrev/diagnostics.hxx>

using namespace std;
using namespace butl;

namespace nixrev
{
  worktree::
  worktree (dir_path d)
      : dir_ (move (d))
  {
  }

  worktree::
  ~worktree ()
  {
    tracer trace ("worktree::~worktree");

    l5 ([&]{trace << "removing " << dir_;});

    // Note that both rm_r() in the warn mode and git_worktree_prune() only
    // warn on errors but the existence check may still fail.
    //
    try
    {
      if (exists (dir_, true /* ignore_error */))
        rm_r (dir_, true /* dir_itself */, 3, rm_error_mode::warn);

      git_worktree_prune ();
    }
    catch (const failed&)
    {
      warn << "unable to clean up worktree " << dir_;
    }
  }

  unique_ptr<workspace> worktree_provider::
  acquire (const string& name)
  {
    tracer trace ("worktree_provider::acquire");

    dir_path cd (cache_directory ());
    mk_p (cd);

    string p (name + '-' + to_string (process::current_id ()) + '-');

    for (size_t n (0);; ++n)
    {
      dir_path d (cd / dir_path (p + to_string (n)));

      try
      {
        if (try_mkdir (d) == mkdir_status::success)
        {
          l4 ([&]{trace << "created " << d;});
          return unique_ptr<workspace> (new worktree (move (d)));
        }
      }
      catch (const system_error& e)
      {
        fail << "unable to create directory " << d << ": " << e;
      }
    }
  }
}
