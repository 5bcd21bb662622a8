// file      : nixrev/shell.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <nixrev/shell.hxx>

#include <nixrev/nixpkgs.hxx>     // attribute_expression()
#include <nixrev/diagnostics.hxx>

using namespace std;

namespace nixrev
{
  string
  shell_expression (const attributes& as)
  {
    string r ("with import <nixpkgs> {};\n"
              "mkShell {\n"
              "  buildInputs = [\n");

    for (const string& a: as)
    {
      r += "    ";
      r += attribute_expression ("pkgs", a);
      r += '\n';
    }

    r += "  ];\n"
         "}\n";
    return r;
  }

  void nix_shell_launcher::
  launch (const attributes& as)
  {
    tracer trace ("nix_shell_launcher::launch");

    path f (temp_dir / "shell.nix");
    write_file (f, shell_expression (as), "shell expression");

    const path& prog (options_.nix_shell ());

    process pr (start (0 /* stdin  */,
                       1 /* stdout */,
                       2 /* stderr */,
                       prog,
                       f));

    // Note: cannot use finish() since the exit status of the interactive
    // shell is whatever the user's last command returned.
    //
    if (!pr.wait ())
    {
      const process_exit& e (*pr.exit);

      if (e.normal ())
        l4 ([&]{trace << prog << " exited with code " << e.code ();});
      else
        warn << "process " << prog << " " << e;
    }
  }
}
