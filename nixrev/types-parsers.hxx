// file      : nixrev/types-parsers.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

// CLI parsers, included into the generated source files.
//

#ifndef NIXREV_TYPES_PARSERS_HXX
#define NIXREV_TYPES_PARSERS_HXX

#include <nixrev/types.hxx>
#include <nixrev/options-types.hxx>

namespace nixrev
{
  namespace cli
  {
    class scanner;

    template <typename T>
    struct parser;

    template <>
    struct parser<path>
    {
      static void
      parse (path&, bool&, scanner&);
    };

    template <>
    struct parser<checkout_option>
    {
      static void
      parse (checkout_option&, bool&, scanner&);
    };

    template <>
    struct parser<eval_source>
    {
      static void
      parse (eval_source&, bool&, scanner&);
    };
  }
}

#endif // NIXREV_TYPES_PARSERS_HXX
