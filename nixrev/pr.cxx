// file      : nixrev/pr.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <nixrev/pr.hxx>

#include <iostream> // cout

#include <nixrev/shell.hxx>
#include <nixrev/nixpkgs.hxx>
#include <nixrev/worktree.hxx>
#include <nixrev/diagnostics.hxx>

using namespace std;

namespace nixrev
{
  // Parse the decimal number in [b, e). Return nullopt if the range is empty
  // or contains a non-digit, or if the number doesn't fit.
  //
  static optional<pr_number>
  parse_number (const string& s, size_t b, size_t e)
  {
    if (b == e)
      return nullopt;

    pr_number r (0);
    for (; b != e; ++b)
    {
      char c (s[b]);

      if (!digit (c))
        return nullopt;

      pr_number d (c - '0');

      if (r > (UINT64_MAX - d) / 10)
        return nullopt;

      r = r * 10 + d;
    }

    return r;
  }

  pr_numbers
  parse_pr_numbers (const strings& args)
  {
    pr_numbers r;

    for (const string& a: args)
    {
      // A range is recognized by its leading <digits>-<digits> part with
      // anything that follows ignored.
      //
      size_t n (a.size ());
      size_t p (0);
      for (; p != n && digit (a[p]); ++p) ;

      if (p != 0 && p != n && a[p] == '-')
      {
        size_t q (p + 1);
        for (; q != n && digit (a[q]); ++q) ;

        optional<pr_number> f (parse_number (a, 0, p));
        optional<pr_number> l (parse_number (a, p + 1, q));

        if (f && l)
        {
          for (pr_number i (*f); i < *l; ++i)
            r.push_back (i);

          continue;
        }
      }

      if (optional<pr_number> v = parse_number (a, 0, n))
        r.push_back (*v);
      else
        fail << "expected number, got '" << a << "'";
    }

    return r;
  }

  int
  review_prs (const pr_numbers& prs,
              const review_request& rq,
              review_context& ctx)
  {
    tracer trace ("review_prs");

    // Workspaces of all the pull requests, including those that failed to
    // build. Those that built must outlive the loop below since their
    // checkouts are referenced via NIX_PATH while the shells are running.
    //
    vector<unique_ptr<workspace>> wss;

    auto release = make_guard ([&wss, &trace] ()
    {
      l5 ([&]{trace << "releasing " << wss.size () << " workspace(s)";});

      while (!wss.empty ())
        wss.pop_back ();
    });

    struct built
    {
      pr_number        pr;
      const workspace* ws;
      attributes       attrs;
    };
    vector<built> bs;

    for (pr_number n: prs)
    {
      wss.push_back (ctx.workspaces.acquire ("pr-" + to_string (n)));
      const workspace& w (*wss.back ());

      review_request r (rq);
      r.worktree = w.directory ();

      try
      {
        attributes as (ctx.pipeline.build_pr (r, n));
        bs.push_back (built {n, &w, move (as)});
      }
      catch (const build_failed&)
      {
        error << pr_url (n) << " failed to build";
      }
    }

    for (const built& b: bs)
    {
      cout << pr_url (b.pr) << endl;

      set_nixpkgs_path (*b.ws);
      ctx.shell.launch (b.attrs);
    }

    return bs.size () == prs.size () ? 0 : 1;
  }

  review_request
  pr_request (const cmd_pr_options& o)
  {
    review_request r;
    r.build_args = o.build_args ();
    r.eval = o.eval ();
    r.packages = attributes (o.package ().begin (), o.package ().end ());
    r.checkout = o.checkout ();

    // An empty token (for example, an exported but blank variable) is
    // treated as unspecified.
    //
    optional<string> t (o.token_specified ()
                        ? optional<string> (o.token ())
                        : getenv ("GITHUB_OAUTH_TOKEN"));
    if (t && !t->empty ())
      r.token = move (*t);

    return r;
  }

  int
  cmd_pr (const cmd_pr_options& o, cli::scanner& args)
  {
    strings ns;
    while (args.more ())
      ns.push_back (args.next ());

    if (ns.empty ())
      fail << "pull request number expected" <<
        info << "run 'nix-review help pr' for more information";

    pr_numbers prs (parse_pr_numbers (ns));

    review_request rq (pr_request (o));

    worktree_provider  wp;
    nix_shell_launcher sh (o);
    nixpkgs_pipeline   bp (o, sh);

    review_context ctx {wp, bp, sh};
    return review_prs (prs, rq, ctx);
  }
}
