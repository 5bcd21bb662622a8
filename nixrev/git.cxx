// file      : nixrev/git.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <nixrev/git.hxx>

#include <libbutl/git.hxx>

#include <nixrev/diagnostics.hxx>

using namespace butl;

namespace nixrev
{
  // git-worktree(1) first appeared in 2.5.0.
  //
  static const semantic_version git_min_ver {2, 5, 0};

  static process_path             git_path;
  static optional<semantic_version> git_ver;

  bool
  git_try_check_version (const semantic_version& min_ver)
  {
    // Query and cache git version on the first call.
    //
    if (!git_ver)
    {
      // Make sure that the getline() function call doesn't end up with an
      // infinite recursion.
      //
      git_ver = semantic_version ();

      optional<string> s (
        git_line (*git_ver, false /* ignore_error */, "--version"));

      if (!s || !(git_ver = git_version (*s)))
        fail << "unable to obtain git version";
    }

    // Note that we don't expect the min_ver to contain the build component,
    // that doesn't matter functionality-wise for git.
    //
    return *git_ver >= min_ver;
  }

  // As above but issue diagnostics and fail if git is older than the
  // specified minimum supported version.
  //
  void
  git_check_version (const semantic_version& min_ver)
  {
    if (!git_try_check_version (min_ver))
    {
      assert (git_ver); // Must have been cached by git_try_check_version().

      fail << "unsupported git version " << *git_ver <<
        info << "minimum supported version is " << min_ver << endf;
    }
  }

  // Return git process path, searching for it on the first call.
  //
  const process_path&
  git_search ()
  {
    tracer trace ("git_search");

    if (git_path.empty ())
    {
      git_path = process::path_search ("git", true /* init */);

      l4 ([&]{trace << "git: '" << git_path.effect << "'";});
    }

    return git_path;
  }

  optional<string>
  git_line (process&& pr, fdpipe&& pipe, bool ie, char delim)
  {
    optional<string> r;

    bool io (false);
    try
    {
      pipe.out.close ();
      ifdstream is (move (pipe.in), fdstream_mode::skip, ifdstream::badbit);

      string l;
      if (!eof (getline (is, l, delim)))
        r = move (l);

      is.close (); // Detect errors.
    }
    catch (const io_error&)
    {
      io = true; // Presumably git failed so check that first.
    }

    // Note: cannot use finish() since ignoring normal error.
    //
    if (!pr.wait ())
    {
      const process_exit& e (*pr.exit);

      if (!e.normal ())
        fail << "process git " << e;

      if (ie)
        r = nullopt;
      else
        throw failed (); // Assume git issued diagnostics.
    }
    else if (io)
      fail << "unable to read git output";

    return r;
  }

  string
  git_rev_parse (const string& ref)
  {
    optional<string> r (git_line (git_min_ver,
                                  false /* ignore_error */,
                                  "rev-parse",
                                  "--verify",
                                  ref));
    if (!r || r->empty ())
      fail << "unable to resolve '" << ref << "' to a commit";

    return move (*r);
  }

  strings
  git_fetch (const string& remote, const strings& refs)
  {
    // Fetch each ref into its own private ref so that we can resolve the
    // commit ids after the fact without disturbing the user's branches.
    //
    auto local_ref = [] (size_t i)
    {
      return "refs/nix-review/" + to_string (i);
    };

    strings specs;
    for (size_t i (0); i != refs.size (); ++i)
      specs.push_back (refs[i] + ':' + local_ref (i));

    run_git (git_min_ver,
             verb >= 2 /* progress */,
             nullptr   /* repo */,
             "-c", "fetch.prune=false",
             "fetch",
             "--force",
             (verb < 2 ? "-q" : nullptr),
             remote,
             specs);

    strings r;
    for (size_t i (0); i != refs.size (); ++i)
      r.push_back (git_rev_parse (local_ref (i)));

    return r;
  }

  void
  git_worktree_add (const dir_path& worktree, const string& commit)
  {
    run_git (git_min_ver,
             verb >= 2 /* progress */,
             nullptr   /* repo */,
             "worktree",
             "add",
             (verb < 2 ? "-q" : nullptr),
             "--detach",
             worktree,
             commit);
  }

  void
  git_merge (const dir_path& worktree, const string& commit)
  {
    run_git (git_min_ver,
             worktree,
             "merge",
             (verb < 2 ? "-q" : nullptr),
             "--no-commit",
             commit);
  }

  void
  git_checkout (const dir_path& worktree, const string& commit)
  {
    run_git (git_min_ver,
             worktree,
             "checkout",
             (verb < 2 ? "-q" : nullptr),
             "--detach",
             commit);
  }

  void
  git_worktree_prune ()
  {
    try
    {
      run_git (git_min_ver,
               false   /* progress */,
               nullptr /* repo */,
               "worktree",
               "prune");
    }
    catch (const failed&)
    {
      warn << "unable to prune git worktrees";
    }
  }
}
