// file      : tests/review-prs/driver.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <nixrev/types.hxx>
#include <nixrev/utility.hxx>

#include <nixrev/pr.hxx>
#include <nixrev/review.hxx>
#include <nixrev/diagnostics.hxx>

#undef NDEBUG
#include <cassert>

using namespace std;
using namespace nixrev;

// Test doubles recording the calls in a shared log.
//
using log_type = strings;

class test_workspace: public workspace
{
public:
  test_workspace (dir_path d, log_type& l): dir_ (move (d)), log_ (l) {}

  ~test_workspace () override
  {
    log_.push_back ("release " + dir_.leaf ().string ());
  }

  const dir_path&
  directory () const override {return dir_;}

private:
  dir_path dir_;
  log_type& log_;
};

class test_provider: public workspace_provider
{
public:
  explicit
  test_provider (log_type& l): log_ (l) {}

  unique_ptr<workspace>
  acquire (const string& name) override
  {
    log_.push_back ("acquire " + name);
    return unique_ptr<workspace> (
      new test_workspace (dir_path ("/tmp/ws") / dir_path (name), log_));
  }

private:
  log_type& log_;
};

class test_pipeline: public build_pipeline
{
public:
  test_pipeline (log_type& l): log_ (l) {}

  set<pr_number> broken;     // Throw build_failed.
  set<pr_number> exploding;  // Throw some unexpected exception.

  vector<review_request> requests;

  attributes
  build_pr (const review_request& rq, pr_number n) override
  {
    log_.push_back ("build " + to_string (n) + ' ' + rq.worktree.string ());
    requests.push_back (rq);

    if (exploding.find (n) != exploding.end ())
      throw runtime_error ("unexpected");

    if (broken.find (n) != broken.end ())
      throw build_failed ();

    return attributes {"pkg" + to_string (n), "common"};
  }

  void
  review_commit (const review_request&, const string&, const string&) override
  {
    assert (false);
  }

private:
  log_type& log_;
};

class test_shell: public shell_launcher
{
public:
  explicit
  test_shell (log_type& l): log_ (l) {}

  void
  launch (const attributes& as) override
  {
    optional<string> np (getenv ("NIX_PATH"));
    assert (np);

    string e ("shell " + *np);
    for (const string& a: as)
      e += ' ' + a;

    log_.push_back (move (e));
  }

private:
  log_type& log_;
};

struct test
{
  log_type         log;
  test_provider    provider {log};
  test_pipeline    pipeline {log};
  test_shell       shell    {log};
  review_context   ctx      {provider, pipeline, shell};
  review_request   request;

  test ()
  {
    request.build_args = "--cores 4";
    request.packages = attributes {"hello"};
  }

  int
  run (const pr_numbers& prs)
  {
    log.clear ();
    return review_prs (prs, request, ctx);
  }
};

int
main ()
{
  verb = 0;

  // All built.
  //
  {
    test t;
    assert (t.run ({1, 2}) == 0);

    assert (t.log == strings ({
      "acquire pr-1",
      "build 1 /tmp/ws/pr-1",
      "acquire pr-2",
      "build 2 /tmp/ws/pr-2",
      "shell nixpkgs=/tmp/ws/pr-1 common pkg1",
      "shell nixpkgs=/tmp/ws/pr-2 common pkg2",
      "release pr-2",
      "release pr-1"}));

    // The shared request parts are passed through.
    //
    assert (t.pipeline.requests.size () == 2);
    for (const review_request& r: t.pipeline.requests)
    {
      assert (r.build_args == "--cores 4");
      assert (r.packages == attributes {"hello"});
    }
  }

  // Partial failure: only the built ones get a shell (in the request order)
  // and all the workspaces are released after the last shell.
  //
  {
    test t;
    t.pipeline.broken = {2, 4};

    assert (t.run ({1, 2, 3, 4, 5}) == 1);

    assert (t.log == strings ({
      "acquire pr-1",
      "build 1 /tmp/ws/pr-1",
      "acquire pr-2",
      "build 2 /tmp/ws/pr-2",
      "acquire pr-3",
      "build 3 /tmp/ws/pr-3",
      "acquire pr-4",
      "build 4 /tmp/ws/pr-4",
      "acquire pr-5",
      "build 5 /tmp/ws/pr-5",
      "shell nixpkgs=/tmp/ws/pr-1 common pkg1",
      "shell nixpkgs=/tmp/ws/pr-3 common pkg3",
      "shell nixpkgs=/tmp/ws/pr-5 common pkg5",
      "release pr-5",
      "release pr-4",
      "release pr-3",
      "release pr-2",
      "release pr-1"}));

    // Same outcome on rerun.
    //
    assert (t.run ({1, 2, 3, 4, 5}) == 1);
    assert (t.run ({1, 3}) == 0);
  }

  // All failed: no shells.
  //
  {
    test t;
    t.pipeline.broken = {7};

    assert (t.run ({7}) == 1);

    assert (t.log == strings ({
      "acquire pr-7",
      "build 7 /tmp/ws/pr-7",
      "release pr-7"}));
  }

  // Duplicates are built separately.
  //
  {
    test t;

    assert (t.run ({3, 3}) == 0);
    assert (count (t.log.begin (), t.log.end (), "acquire pr-3") == 2);
    assert (count (t.log.begin (), t.log.end (), "release pr-3") == 2);
  }

  // Nothing requested.
  //
  {
    test t;
    assert (t.run ({}) == 0);
    assert (t.log.empty ());
  }

  // Unexpected error aborts the batch without starting any shells but still
  // releases all the workspaces.
  //
  {
    test t;
    t.pipeline.broken = {1};
    t.pipeline.exploding = {3};

    bool thrown (false);
    try
    {
      t.run ({1, 2, 3, 4});
    }
    catch (const runtime_error&)
    {
      thrown = true;
    }

    assert (thrown);

    assert (t.log == strings ({
      "acquire pr-1",
      "build 1 /tmp/ws/pr-1",
      "acquire pr-2",
      "build 2 /tmp/ws/pr-2",
      "acquire pr-3",
      "build 3 /tmp/ws/pr-3",
      "release pr-3",
      "release pr-2",
      "release pr-1"}));
  }

  // Search path.
  //
  {
    log_type l;
    test_workspace w (dir_path ("/tmp/ws/pr-9"), l);
    assert (w.nixpkgs_path () == "nixpkgs=/tmp/ws/pr-9");
    assert (nixpkgs_path (dir_path ("/src/nixpkgs")) == "nixpkgs=/src/nixpkgs");
  }

  // URLs.
  //
  assert (pr_url (42) == "https://github.com/NixOS/nixpkgs/pull/42");
}
