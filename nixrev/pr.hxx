// file      : nixrev/pr.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef NIXREV_PR_HXX
#define NIXREV_PR_HXX

#include <nixrev/types.hxx>
#include <nixrev/utility.hxx>

#include <nixrev/review.hxx>
#include <nixrev/pr-options.hxx>

namespace nixrev
{
  // Parse the pull request numbers. Besides plain numbers, the <first>-<last>
  // ranges are accepted and expanded in place to first, first+1, ...,
  // last-1 (note: last is excluded). The order and duplicates are preserved.
  // Issue diagnostics and fail on an invalid number.
  //
  pr_numbers
  parse_pr_numbers (const strings&);

  // Build each pull request in its own workspace and then start a shell for
  // each one that built successfully, in the order specified. Return the
  // exit status: 0 if all of them built and 1 otherwise.
  //
  // Note that a pull request failing to build does not stop the others from
  // being built but any other error does. All the workspaces are kept until
  // the end and are then released in the reverse order.
  //
  int
  review_prs (const pr_numbers&, const review_request&, review_context&);

  // Fill the request parts shared by all the pull requests from the command
  // line options. The GitHub token defaults to GITHUB_OAUTH_TOKEN.
  //
  review_request
  pr_request (const cmd_pr_options&);

  int
  cmd_pr (const cmd_pr_options&, cli::scanner& args);
}

#endif // NIXREV_PR_HXX
