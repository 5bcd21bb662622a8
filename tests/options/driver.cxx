// file      : tests/options/driver.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <nixrev/types.hxx>
#include <nixrev/utility.hxx>

#include <nixrev/pr.hxx>
#include <nixrev/rev.hxx>
#include <nixrev/review.hxx>
#include <nixrev/diagnostics.hxx>
#include <nixrev/nixrev-options.hxx>

#undef NDEBUG
#include <cassert>

using namespace std;
using namespace nixrev;

// Parse the command options the same way the driver does, that is, with
// options and arguments in any order. Save the arguments in args, if
// specified.
//
template <typename O>
static O
parse (strings a, strings* args = nullptr)
{
  a.insert (a.begin (), "nix-review");

  vector<char*> av;
  for (string& s: a)
    av.push_back (&s[0]);

  int argc (static_cast<int> (av.size ()));
  cli::argv_scanner scan (argc, av.data ());

  O o;
  while (scan.more ())
  {
    if (o.parse (scan) && !scan.more ())
      break;

    const char* v (scan.next ());

    if (args != nullptr)
      args->push_back (v);
  }

  return o;
}

template <typename O>
static bool
invalid (const strings& a)
{
  try
  {
    parse<O> (a);
    return false;
  }
  catch (const cli::invalid_value&)
  {
    return true;
  }
}

template <typename O>
static bool
unknown (const strings& a)
{
  try
  {
    parse<O> (a);
    return false;
  }
  catch (const cli::unknown_option&)
  {
    return true;
  }
}

static bool
command_fails (const strings& a)
{
  try
  {
    cli::vector_scanner s (a);
    parse_command<commands> (s, "nix-review command", "nix-review help");
    return false;
  }
  catch (const failed&)
  {
    return true;
  }
}

int
main ()
{
  verb = 0;

  // Commands.
  //
  {
    strings a {"pr", "1"};
    cli::vector_scanner s (a);
    commands c (
      parse_command<commands> (s, "nix-review command", "nix-review help"));

    assert (c.pr () && !c.rev () && !c.help ());
    assert (s.more () && string (s.next ()) == "1");

    commands r;
    assert (parse_command ("rev", r) && r.rev ());

    commands u;
    assert (!parse_command ("review", u));

    assert (command_fails ({}));
    assert (command_fails ({"review", "1"}));
    assert (command_fails ({"--pr"}));
  }

  // Common options followed by no command.
  //
  {
    strings a {"nix-review", "-v"};

    vector<char*> av;
    for (string& s: a)
      av.push_back (&s[0]);

    int argc (static_cast<int> (av.size ()));
    cli::argv_scanner s (argc, av.data ());

    nixrev::options o;
    o.parse (s, cli::unknown_mode::stop);

    assert (o.v () && !o.help () && !o.version ());

    try
    {
      parse_command<commands> (s, "nix-review command", "nix-review help");
      assert (false);
    }
    catch (const failed&) {}
  }

  // pr defaults.
  //
  {
    strings args;
    cmd_pr_options o (parse<cmd_pr_options> ({"1", "2-4"}, &args));

    assert ((args == strings {"1", "2-4"}));
    assert (o.eval () == eval_source::ofborg);
    assert (o.checkout () == checkout_option::merge);
    assert (!o.token_specified ());
    assert (o.build_args ().empty ());
    assert (o.package ().empty ());
  }

  // pr values.
  //
  {
    strings args;
    cmd_pr_options o (
      parse<cmd_pr_options> ({"--eval", "local",
                              "1",
                              "-c", "commit",
                              "--build-args", "-j 4 --cores 2",
                              "2"},
                             &args));

    assert ((args == strings {"1", "2"}));
    assert (o.eval () == eval_source::local);
    assert (o.checkout () == checkout_option::commit);
    assert (o.build_args () == "-j 4 --cores 2");

    assert (parse<cmd_pr_options> ({"--checkout", "merge"}).checkout () ==
            checkout_option::merge);
    assert (parse<cmd_pr_options> ({"--eval", "ofborg"}).eval () ==
            eval_source::ofborg);
  }

  // Enum values are validated.
  //
  assert (invalid<cmd_pr_options> ({"-c", "rebase"}));
  assert (invalid<cmd_pr_options> ({"--checkout", "Merge"}));
  assert (invalid<cmd_pr_options> ({"--eval", "hydra"}));
  assert (invalid<cmd_pr_options> ({"--eval", ""}));

  try
  {
    parse<cmd_pr_options> ({"1", "--eval"});
    assert (false);
  }
  catch (const cli::missing_value&) {}

  // Options belong to their commands.
  //
  assert (unknown<cmd_pr_options> ({"-b", "staging"}));
  assert (unknown<cmd_rev_options> ({"--token", "abc"}));
  assert (unknown<cmd_rev_options> ({"-c", "merge"}));

  // The review options are shared by both commands and the package option
  // can be repeated.
  //
  {
    strings a {"-p", "hello", "--build-args", "-j 2", "--package", "curl",
               "-p", "hello"};

    cmd_pr_options  po (parse<cmd_pr_options>  (a));
    cmd_rev_options ro (parse<cmd_rev_options> (a));

    strings ps {"hello", "curl", "hello"};

    assert (po.package () == ps && ro.package () == ps);
    assert (po.build_args () == "-j 2" && ro.build_args () == "-j 2");

    review_request pr (pr_request (po));
    review_request rr (rev_request (ro));

    attributes as {"curl", "hello"};

    assert (pr.packages == as && rr.packages == as);
    assert (pr.build_args == "-j 2" && rr.build_args == "-j 2");
  }

  // rev branch.
  //
  {
    strings args;
    cmd_rev_options o (parse<cmd_rev_options> ({"HEAD~1"}, &args));

    assert ((args == strings {"HEAD~1"}));
    assert (o.branch () == "master");

    assert (parse<cmd_rev_options> ({"-b", "staging", "abc"}).branch () ==
            "staging");
    assert (parse<cmd_rev_options> ({"abc", "--branch", "release-24.05"})
            .branch () == "release-24.05");
  }

  // GitHub token: the option overrides the environment and an empty value
  // is the same as none.
  //
  {
    unsetenv ("GITHUB_OAUTH_TOKEN");
    assert (!pr_request (parse<cmd_pr_options> ({"1"})).token);

    setenv ("GITHUB_OAUTH_TOKEN", "env-token");
    {
      review_request r (pr_request (parse<cmd_pr_options> ({"1"})));
      assert (r.token && *r.token == "env-token");
    }

    {
      review_request r (
        pr_request (parse<cmd_pr_options> ({"--token", "opt-token", "1"})));
      assert (r.token && *r.token == "opt-token");
    }

    assert (!pr_request (parse<cmd_pr_options> ({"--token", "", "1"})).token);

    setenv ("GITHUB_OAUTH_TOKEN", "");
    assert (!pr_request (parse<cmd_pr_options> ({"1"})).token);

    unsetenv ("GITHUB_OAUTH_TOKEN");
  }

  // Other request defaults.
  //
  {
    review_request r (pr_request (parse<cmd_pr_options> ({"1"})));

    assert (r.eval == eval_source::ofborg);
    assert (r.checkout == checkout_option::merge);
    assert (r.packages.empty () && r.build_args.empty ());
    assert (r.worktree.empty ());
  }
}
