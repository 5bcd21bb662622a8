// file      : nixrev/rev.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef NIXREV_REV_HXX
#define NIXREV_REV_HXX

#include <nixrev/types.hxx>
#include <nixrev/utility.hxx>

#include <nixrev/review.hxx>
#include <nixrev/rev-options.hxx>

namespace nixrev
{
  // Resolve names using git-rev-parse(1) in the current working directory.
  //
  class git_commit_resolver: public commit_resolver
  {
  public:
    virtual string
    resolve (const string&) override;
  };

  // Resolve the ref to the commit id and review it against the upstream
  // branch in its own workspace. Note that if the ref cannot be resolved,
  // then no workspace is acquired.
  //
  void
  review_rev (const string& ref,
              const string& branch,
              const review_request&,
              commit_resolver&,
              review_context&);

  review_request
  rev_request (const cmd_rev_options&);

  int
  cmd_rev (const cmd_rev_options&, cli::scanner& args);
}

#endif // NIXREV_REV_HXX
