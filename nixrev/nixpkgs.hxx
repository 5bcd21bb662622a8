// file      : nixrev/nixpkgs.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef NIXREV_NIXPKGS_HXX
#define NIXREV_NIXPKGS_HXX

#include <nixrev/types.hxx>
#include <nixrev/utility.hxx>

#include <nixrev/review.hxx>
#include <nixrev/common-options.hxx>

namespace nixrev
{
  // Output paths of the packages keyed by attribute path. The output paths
  // are keyed by the output name (out, dev, etc).
  //
  using package_outputs = map<string, map<string, string>>;

  // Parse the nix-env --query --json --out-path output. The name is used in
  // diagnostics. Throw invalid_json_input on error.
  //
  package_outputs
  parse_packages (istream&, const string& name);

  // Return the attributes of the packages that are new or whose output paths
  // have changed.
  //
  attributes
  differences (const package_outputs& before, const package_outputs& after);

  // Return the Nix expression that refers to the attribute path in the
  // specified attribute set, for example, pkgs."python3Packages"."requests".
  //
  string
  attribute_expression (const string& set, const string& attr);

  // Return the build.nix file contents that evaluates to the list of
  // packages in the nixpkgs checkout in the same directory.
  //
  string
  build_expression (const attributes&);

  // Build and review nixpkgs changes in a clone of nixpkgs in the current
  // working directory.
  //
  class nixpkgs_pipeline: public build_pipeline
  {
  public:
    nixpkgs_pipeline (const common_options&, shell_launcher&);

    virtual attributes
    build_pr (const review_request&, pr_number) override;

    virtual void
    review_commit (const review_request&,
                   const string& branch,
                   const string& commit) override;

  private:
    attributes
    build_commit (const review_request&,
                  const string& base,
                  const string& commit,
                  checkout_option);

    package_outputs
    list_packages (const dir_path&);

    attributes
    build (const review_request&, const attributes&);

    string
    current_system ();

  private:
    const common_options& options_;
    shell_launcher& shell_;
  };
}

#endif // NIXREV_NIXPKGS_HXX
