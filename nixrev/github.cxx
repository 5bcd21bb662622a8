// file      : nixrev/github.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <nixrev/github.hxx>

#include <libbutl/curl.hxx>
#include <libbutl/json/parser.hxx>

#include <nixrev/review.hxx>      // nixpkgs_repo
#include <nixrev/diagnostics.hxx>

using namespace std;
using namespace butl;

namespace nixrev
{
  namespace github
  {
    using event = json::event;

    string
    get (const common_options& o,
         const string& u,
         const optional<string>& token,
         const char* accept)
    {
      tracer trace ("github::get");

      l4 ([&]{trace << "GET " << u;});

      // Note that we read the HTTP response status and headers ourselves
      // (rather than using --fail) so that we can report the status.
      //
      cstrings v;
      if (verb < 4)
      {
        v.push_back ("-s");
        v.push_back ("-S"); // But show errors.
      }
      else
        v.push_back ("-v");

      strings hs {"Accept: " + string (accept)};
      if (token && !token->empty ())
        hs.push_back ("Authorization: token " + *token);

      cstrings ho;
      for (const string& h: hs)
      {
        ho.push_back ("-H");
        ho.push_back (h.c_str ());
      }

      fdpipe pipe (open_pipe ());

      process pr (start (0    /* stdin  */,
                         pipe /* stdout */,
                         2    /* stderr */,
                         o.curl (),
                         v,
                         "-A", (NIXREV_USER_AGENT " curl"),
                         ho,
                         o.curl_option (),
                         "--include",
                         "--location",
                         u));

      // Shouldn't throw, unless something is severely damaged.
      //
      pipe.out.close ();

      string body;
      optional<curl::http_status> status;
      optional<string> bad; // Bad response description.
      bool io (false);

      try
      {
        ifdstream is (move (pipe.in),
                      fdstream_mode::skip,
                      ifdstream::badbit | ifdstream::failbit | ifdstream::eofbit);

        // With --location curl prints the status line and headers of every
        // response in the redirect chain.
        //
        for (;;)
        {
          curl::http_status rs (
            curl::read_http_status (is, false /* skip_headers */));

          bool location (false);
          for (string l; !(l = curl::read_http_response_line (is)).empty (); )
          {
            if (icasecmp ("Location:", l, 9) == 0)
              location = true;
          }

          if (!(location && rs.code >= 300 && rs.code < 400))
          {
            status = move (rs);
            break;
          }
        }

        is.exceptions (ifdstream::badbit);

        body = is.read_text ();
        is.close (); // Detect errors.
      }
      catch (const invalid_argument& e)
      {
        bad = string ("unable to read HTTP response status line: ") +
              e.what ();
      }
      catch (const io_error&)
      {
        // Presumably curl failed and issued diagnostics so let finish() try
        // to deal with that first.
        //
        io = true;
      }

      // Note that a network error (as opposed to an HTTP error) is reported
      // by curl which exits with a non-zero status.
      //
      try
      {
        finish (o.curl (), pr, io);
      }
      catch (const process_failed&)
      {
        fail << "unable to fetch " << u;
      }

      if (bad)
        fail << *bad << " for " << u;

      if (status->code != 200)
      {
        diag_record dr (fail);
        dr << "unable to fetch " << u << ": HTTP status code "
           << status->code;

        if (!status->reason.empty ())
          dr << " (" << lcase (status->reason) << ')';

        if ((status->code == 403 || status->code == 429) &&
            (!token || token->empty ()))
          dr << info << "consider specifying GitHub access token with "
                     << "--token or GITHUB_OAUTH_TOKEN";
      }

      return body;
    }

    [[noreturn]] static void
    missing_member (const json::parser& p, const char* o, const char* m)
    {
      throw json::invalid_json_input (
        p.input_name,
        p.line (), p.column (), p.position (),
        o + string (" object is missing member '") + m + '\'');
    }

    // Parse the {"<name>": "<value>", ...} object returning the value of
    // the specified member and skipping all the others.
    //
    static string
    parse_member (json::parser& p, const char* object, const char* member)
    {
      p.next_expect (event::begin_object);

      optional<string> r;
      while (p.next_expect (event::name, event::end_object))
      {
        if (p.name () == member)
          r = p.next_expect_string ();
        else
          p.next_expect_value_skip ();
      }

      if (!r)
        missing_member (p, object, member);

      return move (*r);
    }

    pull_request
    parse_pull_request (const string& s, const string& name)
    {
      json::parser p (s.data (), s.size (), name.c_str ());

      pull_request r;

      p.next_expect (event::begin_object);

      bool nu (false), br (false), hs (false), su (false), hu (false);

      // Skip unknown/uninteresting members.
      //
      while (p.next_expect (event::name, event::end_object))
      {
        auto c = [&p] (bool& v, const char* n)
        {
          return p.name () == n ? (v = true) : false;
        };

        if      (c (nu, "number"))       r.number = p.next_expect_number<pr_number> ();
        else if (c (br, "base"))         r.base_ref = parse_member (p, "base", "ref");
        else if (c (hs, "head"))         r.head_sha = parse_member (p, "head", "sha");
        else if (c (su, "statuses_url")) r.statuses_url = p.next_expect_string ();
        else if (c (hu, "html_url"))     r.html_url = p.next_expect_string ();
        else p.next_expect_value_skip ();
      }

      if (!nu) missing_member (p, "pull_request", "number");
      if (!br) missing_member (p, "pull_request", "base");
      if (!hs) missing_member (p, "pull_request", "head");
      if (!su) missing_member (p, "pull_request", "statuses_url");
      if (!hu) missing_member (p, "pull_request", "html_url");

      return r;
    }

    optional<string>
    parse_ofborg_gist_url (const string& s, const string& name)
    {
      json::parser p (s.data (), s.size (), name.c_str ());

      optional<string> r;

      p.next_expect (event::begin_array);

      while (p.next_expect (event::begin_object, event::end_array))
      {
        string description;
        string target;
        string creator;

        while (p.next_expect (event::name, event::end_object))
        {
          const string& n (p.name ());

          if (n == "description" || n == "target_url")
          {
            string& v (n == "description" ? description : target);

            if (string* sv = p.next_expect_string_null ())
              v = move (*sv);
          }
          else if (n == "creator")
          {
            if (p.next_expect (event::begin_object, event::null))
            {
              while (p.next_expect (event::name, event::end_object))
              {
                if (p.name () == "login")
                  creator = p.next_expect_string ();
                else
                  p.next_expect_value_skip ();
              }
            }
          }
          else
            p.next_expect_value_skip ();
        }

        // The first matching status wins but we still parse the rest to
        // detect malformed input.
        //
        if (!r                          &&
            description == "^.^!"       &&
            creator == "GrahamcOfBorg"  &&
            !target.empty ())
        {
          try
          {
            url u (target);

            if (!u.path || u.path->empty ())
              throw invalid_argument ("no path");

            r = "https://gist.githubusercontent.com/GrahamcOfBorg/" +
                *u.path + "/raw/";
          }
          catch (const invalid_argument& e)
          {
            throw json::invalid_json_input (
              p.input_name,
              p.line (), p.column (), p.position (),
              "invalid ofborg evaluation URL '" + target + "': " + e.what ());
          }
        }
      }

      return r;
    }

    system_packages
    parse_ofborg_packages (const string& s)
    {
      system_packages r;

      size_t ln (0);
      for (size_t b (0), e; b < s.size (); b = e + 1)
      {
        ++ln;

        if ((e = s.find ('\n', b)) == string::npos)
          e = s.size ();

        strings ws (split_words (string (s, b, e - b)));

        if (ws.empty ())
          break;

        if (ws.size () != 2)
          throw invalid_argument (
            "line " + to_string (ln) + ": expected <system> <attribute>");

        r[move (ws[0])].insert (move (ws[1]));
      }

      return r;
    }

    static const char api[] = "https://api.github.com";

    pull_request
    fetch_pull_request (const common_options& o,
                        const optional<string>& token,
                        pr_number n)
    {
      string u (string (api) + "/repos/" + nixpkgs_repo + "/pulls/" +
                to_string (n));

      string b (get (o, u, token));

      try
      {
        return parse_pull_request (b, u);
      }
      catch (const json::invalid_json_input& e)
      {
        fail << "invalid pull request " << n << " metadata: " << e <<
          info << "url: " << u << endf;
      }
    }

    optional<system_packages>
    fetch_ofborg_packages (const common_options& o,
                           const optional<string>& token,
                           const pull_request& pr)
    {
      tracer trace ("github::fetch_ofborg_packages");

      const string& su (pr.statuses_url);
      string b (get (o, su, token));

      optional<string> gu;
      try
      {
        gu = parse_ofborg_gist_url (b, su);
      }
      catch (const json::invalid_json_input& e)
      {
        fail << "invalid pull request " << pr.number << " statuses: " << e <<
          info << "url: " << su;
      }

      if (!gu)
        return nullopt;

      l4 ([&]{trace << "ofborg evaluation results: " << *gu;});

      string t (get (o, *gu, nullopt /* token */, "text/plain"));

      try
      {
        return parse_ofborg_packages (t);
      }
      catch (const invalid_argument& e)
      {
        fail << "invalid ofborg evaluation results: " << e <<
          info << "url: " << *gu << endf;
      }
    }
  }
}
