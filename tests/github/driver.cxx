// file      : tests/github/driver.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <libbutl/json/parser.hxx>

#include <nixrev/types.hxx>
#include <nixrev/utility.hxx>

#include <nixrev/github.hxx>

#undef NDEBUG
#include <cassert>

using namespace std;
using namespace nixrev;
using namespace nixrev::github;

using butl::json::invalid_json_input;

static bool
invalid_pr (const string& s)
{
  try
  {
    parse_pull_request (s, "test");
    return false;
  }
  catch (const invalid_json_input&)
  {
    return true;
  }
}

static bool
invalid_statuses (const string& s)
{
  try
  {
    parse_ofborg_gist_url (s, "test");
    return false;
  }
  catch (const invalid_json_input&)
  {
    return true;
  }
}

static bool
invalid_packages (const string& s)
{
  try
  {
    parse_ofborg_packages (s);
    return false;
  }
  catch (const invalid_argument&)
  {
    return true;
  }
}

int
main ()
{
  // Pull request.
  //
  {
    pull_request pr (parse_pull_request (
      R"({
           "url": "https://api.github.com/repos/NixOS/nixpkgs/pulls/49257",
           "id": 226123123,
           "html_url": "https://github.com/NixOS/nixpkgs/pull/49257",
           "number": 49257,
           "state": "open",
           "title": "hello: 2.10 -> 2.12",
           "user": {"login": "someone", "id": 1},
           "labels": [{"name": "10.rebuild-linux: 1-10"}],
           "merge_commit_sha": null,
           "statuses_url": "https://api.github.com/repos/NixOS/nixpkgs/statuses/1234abcd",
           "head": {"label": "someone:hello", "ref": "hello", "sha": "1234abcd"},
           "base": {"label": "NixOS:master", "ref": "master", "sha": "5678ef00"},
           "draft": false
         })", "test"));

    assert (pr.number == 49257);
    assert (pr.base_ref == "master");
    assert (pr.head_sha == "1234abcd");
    assert (pr.statuses_url ==
            "https://api.github.com/repos/NixOS/nixpkgs/statuses/1234abcd");
    assert (pr.html_url == "https://github.com/NixOS/nixpkgs/pull/49257");
  }

  assert (invalid_pr ("[]"));
  assert (invalid_pr ("{\"number\": 1}"));
  assert (invalid_pr (R"({"number": "1", "html_url": "", "statuses_url": "",
                          "head": {"sha": ""}, "base": {"ref": ""}})"));
  assert (invalid_pr (R"({"number": 1, "html_url": "", "statuses_url": "",
                          "head": {"ref": "x"}, "base": {"ref": ""}})"));

  // Statuses.
  //
  {
    optional<string> u (parse_ofborg_gist_url (
      R"([
           {
             "state": "pending",
             "description": "Waiting for builds",
             "target_url": null,
             "creator": {"login": "GrahamcOfBorg"}
           },
           {
             "state": "success",
             "description": "^.^!",
             "target_url": "https://gist.github.com/abcdef0123",
             "creator": {"login": "someone-else"}
           },
           {
             "state": "success",
             "description": "^.^!",
             "target_url": "https://gist.github.com/0123abcdef",
             "creator": {"login": "GrahamcOfBorg", "id": 1}
           },
           {
             "state": "success",
             "description": "^.^!",
             "target_url": "https://gist.github.com/ffffffff",
             "creator": {"login": "GrahamcOfBorg"}
           }
         ])", "test"));

    assert (u &&
            *u == "https://gist.githubusercontent.com/GrahamcOfBorg/"
                  "0123abcdef/raw/");
  }

  assert (!parse_ofborg_gist_url ("[]", "test"));
  assert (!parse_ofborg_gist_url (
            R"([{"description": "^.^!", "target_url": "",
                 "creator": {"login": "GrahamcOfBorg"}},
                {"description": null, "target_url": null, "creator": null}])",
            "test"));

  assert (invalid_statuses ("{}"));
  assert (invalid_statuses ("[1]"));
  assert (invalid_statuses (R"([{"description": "^.^!",
                                 "target_url": "https://gist.github.com",
                                 "creator": {"login": "GrahamcOfBorg"}}])"));

  // Evaluation results.
  //
  {
    system_packages ps (parse_ofborg_packages (
      "x86_64-linux hello\n"
      "x86_64-linux python3Packages.requests\n"
      "aarch64-linux hello\n"
      "x86_64-darwin hello\n"
      "x86_64-linux hello\n"));

    assert (ps.size () == 3);
    assert (ps["x86_64-linux"] ==
            attributes ({"hello", "python3Packages.requests"}));
    assert (ps["aarch64-linux"] == attributes ({"hello"}));
  }

  // Stops at the first empty line.
  //
  {
    system_packages ps (parse_ofborg_packages ("x86_64-linux hello\n"
                                               "\n"
                                               "junk\n"));
    assert (ps.size () == 1);
  }

  assert (parse_ofborg_packages ("").empty ());
  assert (parse_ofborg_packages ("x86_64-linux hello").size () == 1);

  assert (invalid_packages ("x86_64-linux\n"));
  assert (invalid_packages ("x86_64-linux hello world\n"));
}
