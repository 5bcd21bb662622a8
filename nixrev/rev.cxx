// file      : nixrev/rev.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <nixrev/rev.hxx>

#include <nixrev/git.hxx>
#include <nixrev/shell.hxx>
#include <nixrev/nixpkgs.hxx>
#include <nixrev/worktree.hxx>
#include <nixrev/diagnostics.hxx>

using namespace std;

namespace nixrev
{
  string git_commit_resolver::
  resolve (const string& ref)
  {
    return git_rev_parse (ref);
  }

  void
  review_rev (const string& ref,
              const string& branch,
              const review_request& rq,
              commit_resolver& cr,
              review_context& ctx)
  {
    tracer trace ("review_rev");

    string commit (cr.resolve (ref));

    l4 ([&]{trace << ref << " resolved to " << commit;});

    unique_ptr<workspace> w (ctx.workspaces.acquire ("rev-" + commit));

    review_request r (rq);
    r.worktree = w->directory ();

    ctx.pipeline.review_commit (r, branch, commit);
  }

  review_request
  rev_request (const cmd_rev_options& o)
  {
    review_request r;
    r.build_args = o.build_args ();
    r.packages = attributes (o.package ().begin (), o.package ().end ());
    return r;
  }

  int
  cmd_rev (const cmd_rev_options& o, cli::scanner& args)
  {
    if (!args.more ())
      fail << "commit expected" <<
        info << "run 'nix-review help rev' for more information";

    string ref (args.next ());

    if (args.more ())
      fail << "unexpected argument '" << args.next () << "'" <<
        info << "run 'nix-review help rev' for more information";

    review_request rq (rev_request (o));

    git_commit_resolver cr;
    worktree_provider   wp;
    nix_shell_launcher  sh (o);
    nixpkgs_pipeline    bp (o, sh);

    review_context ctx {wp, bp, sh};

    try
    {
      review_rev (ref, o.branch (), rq, cr, ctx);
    }
    catch (const build_failed&)
    {
      error << ref << " failed to build";
      return 1;
    }

    return 0;
  }
}
