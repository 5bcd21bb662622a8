// file      : nixrev/options-types.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef NIXREV_OPTIONS_TYPES_HXX
#define NIXREV_OPTIONS_TYPES_HXX

namespace nixrev
{
  // What to check out when building a pull request: merge it into the
  // target branch or build it as the author committed it.
  //
  enum class checkout_option
  {
    merge,
    commit
  };

  // Where to get the list of packages affected by a change from: the ofborg
  // CI evaluation results or a local evaluation of nixpkgs.
  //
  enum class eval_source
  {
    ofborg,
    local
  };
}

#endif // NIXREV_OPTIONS_TYPES_HXX
