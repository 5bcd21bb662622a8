// file      : nixrev/github.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef NIXREV_GITHUB_HXX
#define NIXREV_GITHUB_HXX

#include <nixrev/types.hxx>
#include <nixrev/utility.hxx>

#include <nixrev/common-options.hxx>

namespace nixrev
{
  namespace github
  {
    // The subset of the pull request metadata we are interested in.
    //
    struct pull_request
    {
      pr_number number;
      string    base_ref;     // Target branch name (for example, master).
      string    head_sha;
      string    statuses_url; // Commit statuses of the head.
      string    html_url;
    };

    // Evaluated attributes per system (for example, x86_64-linux).
    //
    using system_packages = map<string, attributes>;

    // GET the resource over HTTP(S) using the curl program and return the
    // response body. If the token is present, then pass it as the GitHub
    // access token.
    //
    // Issue diagnostics and fail if unable to execute curl, the request
    // fails, or the response status is not 200.
    //
    string
    get (const common_options&,
         const string& url,
         const optional<string>& token,
         const char* accept = "application/vnd.github.v3+json");

    // Parse the GitHub API responses. The name is used in diagnostics.
    // Throw invalid_json_input if the input is malformed or a member we need
    // is missing.
    //
    pull_request
    parse_pull_request (const string& json, const string& name);

    // Return the ofborg evaluation results gist URL (the raw content one)
    // from the commit statuses, if present.
    //
    optional<string>
    parse_ofborg_gist_url (const string& json, const string& name);

    // Parse the ofborg evaluation results gist: one <system> <attribute>
    // pair per line. Throw invalid_argument if a line is malformed.
    //
    system_packages
    parse_ofborg_packages (const string& text);

    // Query the pull request metadata.
    //
    pull_request
    fetch_pull_request (const common_options&,
                        const optional<string>& token,
                        pr_number);

    // Query the packages that ofborg found to be changed by the pull request.
    // Return nullopt if ofborg has not (yet) evaluated the head.
    //
    optional<system_packages>
    fetch_ofborg_packages (const common_options&,
                           const optional<string>& token,
                           const pull_request&);
  }
}

#endif // NIXREV_GITHUB_HXX
