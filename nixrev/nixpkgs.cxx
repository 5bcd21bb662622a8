// file      : nixrev/nixpkgs.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <nixrev/nixpkgs.hxx>

#include <libbutl/json/parser.hxx>

#include <nixrev/git.hxx>
#include <nixrev/github.hxx>
#include <nixrev/diagnostics.hxx>

using namespace std;
using namespace butl;

namespace nixrev
{
  using event = json::event;

  package_outputs
  parse_packages (istream& is, const string& name)
  {
    json::parser p (is, name.c_str ());

    package_outputs r;

    // {"<attr>": {"name": ..., "outputs": {"<output>": "<path>", ...}, ...}}
    //
    p.next_expect (event::begin_object);

    while (p.next_expect (event::name, event::end_object))
    {
      map<string, string>& os (r[p.name ()]);

      p.next_expect (event::begin_object);

      while (p.next_expect (event::name, event::end_object))
      {
        if (p.name () == "outputs")
        {
          p.next_expect (event::begin_object);

          while (p.next_expect (event::name, event::end_object))
          {
            string n (p.name ());
            string* v (p.next_expect_string_null ());

            os[move (n)] = v != nullptr ? move (*v) : string ();
          }
        }
        else
          p.next_expect_value_skip ();
      }
    }

    return r;
  }

  attributes
  differences (const package_outputs& before, const package_outputs& after)
  {
    attributes r;

    for (const auto& p: after)
    {
      auto i (before.find (p.first));

      if (i == before.end () || i->second != p.second)
        r.insert (p.first);
    }

    return r;
  }

  string
  attribute_expression (const string& set, const string& attr)
  {
    string r (set);

    for (size_t b (0), e; b <= attr.size (); b = e + 1)
    {
      if ((e = attr.find ('.', b)) == string::npos)
        e = attr.size ();

      r += ".\"";

      for (size_t i (b); i != e; ++i)
      {
        char c (attr[i]);

        if (c == '"' || c == '\\' || c == '$')
          r += '\\';

        r += c;
      }

      r += '"';
    }

    return r;
  }

  string
  build_expression (const attributes& as)
  {
    string r ("let\n"
              "  pkgs = import ./. {};\n"
              "in\n"
              "[\n");

    for (const string& a: as)
    {
      r += "  ";
      r += attribute_expression ("pkgs", a);
      r += '\n';
    }

    r += "]\n";
    return r;
  }

  nixpkgs_pipeline::
  nixpkgs_pipeline (const common_options& o, shell_launcher& s)
      : options_ (o), shell_ (s)
  {
  }

  attributes nixpkgs_pipeline::
  build_pr (const review_request& rq, pr_number n)
  {
    tracer trace ("nixpkgs_pipeline::build_pr");

    const common_options& o (options_);

    // Note that the failure to query GitHub is fatal rather than a build
    // failure.
    //
    github::pull_request pr (github::fetch_pull_request (o, rq.token, n));

    l4 ([&]{trace << "pull request " << pr.number << " targets "
                  << pr.base_ref << " at " << pr.head_sha;});

    // If the packages are specified explicitly, then there is nothing to
    // evaluate.
    //
    bool filtered (!rq.packages.empty ());

    optional<github::system_packages> sps;
    string system;

    if (!filtered && rq.eval == eval_source::ofborg)
    {
      sps = github::fetch_ofborg_packages (o, rq.token, pr);

      if (sps)
        system = current_system ();
      else
        warn << "no ofborg evaluation for " << pr_url (n) <<
          info << "falling back to local evaluation";
    }

    try
    {
      strings cs (git_fetch (nixpkgs_remote,
                             strings {pr.base_ref,
                                      "pull/" + to_string (n) + "/head"}));

      const string& base (cs[0]);
      const string& head (cs[1]);

      if (!filtered && !sps)
        return build_commit (rq, base, head, rq.checkout);

      git_worktree_add (rq.worktree, base);

      if (rq.checkout == checkout_option::merge)
        git_merge (rq.worktree, head);
      else
        git_checkout (rq.worktree, head);

      attributes as;

      if (filtered)
        as = rq.packages;
      else
      {
        auto i (sps->find (system));

        if (i != sps->end ())
          as = i->second;
        else
          l4 ([&]{trace << "no packages for " << system;});
      }

      return build (rq, as);
    }
    catch (const process_failed&)
    {
      throw build_failed ();
    }
  }

  void nixpkgs_pipeline::
  review_commit (const review_request& rq,
                 const string& branch,
                 const string& commit)
  {
    attributes as;

    try
    {
      strings cs (git_fetch (nixpkgs_remote, strings {branch}));
      as = build_commit (rq, cs[0], commit, checkout_option::merge);
    }
    catch (const process_failed&)
    {
      throw build_failed ();
    }

    if (!as.empty ())
    {
      set_nixpkgs_path (rq.worktree);
      shell_.launch (as);
    }
  }

  // Check out the base commit, apply the commit to it (either by merging
  // or checking it out), and build the packages that have changed.
  //
  attributes nixpkgs_pipeline::
  build_commit (const review_request& rq,
                const string& base,
                const string& commit,
                checkout_option co)
  {
    bool filtered (!rq.packages.empty ());

    git_worktree_add (rq.worktree, base);

    package_outputs before;
    if (!filtered)
    {
      if (verb)
        text << "evaluating " << base;

      before = list_packages (rq.worktree);
    }

    if (co == checkout_option::merge)
      git_merge (rq.worktree, commit);
    else
      git_checkout (rq.worktree, commit);

    attributes as;
    if (filtered)
      as = rq.packages;
    else
    {
      if (verb)
        text << "evaluating " << commit;

      as = differences (before, list_packages (rq.worktree));
    }

    return build (rq, as);
  }

  package_outputs nixpkgs_pipeline::
  list_packages (const dir_path& d)
  {
    const path& prog (options_.nix_env ());

    fdpipe pipe (open_pipe ());

    process pr (start (0    /* stdin  */,
                       pipe /* stdout */,
                       2    /* stderr */,
                       prog,
                       "-f", d,
                       "--query",
                       "--available",
                       "--attr-path",
                       "--json",
                       "--out-path"));

    // Shouldn't throw, unless something is severely damaged.
    //
    pipe.out.close ();

    package_outputs r;
    bool io (false);

    try
    {
      ifdstream is (move (pipe.in), fdstream_mode::skip, ifdstream::badbit);

      r = parse_packages (is, "nix-env output");
      is.close (); // Detect errors.
    }
    catch (const json::invalid_json_input& e)
    {
      finish (prog, pr); // Throws on process failure.

      fail << "invalid " << prog << " output: " << e;
    }
    catch (const io_error&)
    {
      // Presumably the child process failed and issued diagnostics so let
      // finish() try to deal with that.
      //
      io = true;
    }

    finish (prog, pr, io);

    return r;
  }

  attributes nixpkgs_pipeline::
  build (const review_request& rq, const attributes& as)
  {
    if (as.empty ())
    {
      if (verb)
        info << "nothing to build";

      return as;
    }

    path f (rq.worktree / "build.nix");
    write_file (f, build_expression (as), "build expression");

    if (verb)
    {
      diag_record dr (text);
      dr << "building " << as.size () << " package(s):";

      for (const string& a: as)
        dr << ' ' << a;
    }

    run (options_.nix_build (),
         f,
         "--no-out-link",
         "--keep-going",
         split_words (rq.build_args));

    return as;
  }

  string nixpkgs_pipeline::
  current_system ()
  {
    const path& prog (options_.nix_instantiate ());

    string r;

    try
    {
      r = run_output (prog, "--eval", "--expr", "builtins.currentSystem");
    }
    catch (const process_failed&)
    {
      fail << "unable to obtain current system from " << prog;
    }

    // The string value is printed quoted.
    //
    if (r.size () > 2 && r.front () == '"' && r.back () == '"')
      r = string (r, 1, r.size () - 2);
    else
      fail << "invalid " << prog << " output '" << r << "'";

    return r;
  }
}
