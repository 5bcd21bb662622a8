// file      : nixrev/types-parsers.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <nixrev/types-parsers.hxx>

#include <nixrev/common-options.hxx> // nixrev::cli namespace

namespace nixrev
{
  namespace cli
  {
    void parser<path>::
    parse (path& x, bool& xs, scanner& s)
    {
      const char* o (s.next ());

      if (!s.more ())
        throw missing_value (o);

      const char* v (s.next ());

      try
      {
        x = path (v);

        if (x.empty ())
          throw invalid_value (o, v);
      }
      catch (const invalid_path&)
      {
        throw invalid_value (o, v);
      }

      xs = true;
    }

    void parser<checkout_option>::
    parse (checkout_option& r, bool& xs, scanner& s)
    {
      const char* o (s.next ());

      if (!s.more ())
        throw missing_value (o);

      string v (s.next ());

      if      (v == "merge")  r = checkout_option::merge;
      else if (v == "commit") r = checkout_option::commit;
      else throw invalid_value (o, v);

      xs = true;
    }

    void parser<eval_source>::
    parse (eval_source& r, bool& xs, scanner& s)
    {
      const char* o (s.next ());

      if (!s.more ())
        throw missing_value (o);

      string v (s.next ());

      if      (v == "ofborg") r = eval_source::ofborg;
      else if (v == "local")  r = eval_source::local;
      else throw invalid_value (o, v);

      xs = true;
    }
  }
}
