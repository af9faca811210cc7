// file      : ddlgen/ddlgen.cxx
// copyright : Copyright (c) 2009-2013 Code Synthesis Tools CC
// license   : GNU GPL v3; see accompanying LICENSE file

#include <memory>  // std::auto_ptr
#include <string>
#include <cstddef> // size_t
#include <iostream>

#include <cutl/fs/path.hxx>

#include <ddlgen/version.hxx>
#include <ddlgen/options.hxx>
#include <ddlgen/parser.hxx>
#include <ddlgen/validator.hxx>
#include <ddlgen/generator.hxx>
#include <ddlgen/semantics/unit.hxx>

using namespace std;
using cutl::fs::path;
using cutl::fs::invalid_path;

int
main (int argc, char* argv[])
{
  ostream& e (cerr);

  try
  {
    cli::argv_file_scanner scan (argc, argv, "--options-file");
    options ops (scan);

    // Handle --version.
    //
    if (ops.version ())
    {
      e << "Relational schema DDL generator " DDLGEN_VERSION_STR << endl
        << "Copyright (c) 2009-2013 Code Synthesis Tools CC" << endl;

      e << "This is free software; see the source for copying conditions. "
        << "There is NO\nwarranty; not even for MERCHANTABILITY or FITNESS "
        << "FOR A PARTICULAR PURPOSE." << endl;

      return 0;
    }

    // Handle --help.
    //
    if (ops.help ())
    {
      e << "Usage: " << argv[0] << " [options] file [file ...]"
        << endl
        << "Options:" << endl;

      options::print_usage (e);
      return 0;
    }

    // Check that required options were specifed.
    //
    if (!ops.database_specified ())
    {
      e << argv[0] << ": error: no database specified with the --database "
        << "option" << endl;
      return 1;
    }

    if (ops.mysql_engine_specified () && ops.database () != database::mysql)
    {
      e << argv[0] << ": error: --mysql-engine is only valid for the mysql "
        << "database" << endl;
      return 1;
    }

    if (!scan.more ())
    {
      e << argv[0] << ": error: input file expected" << endl;
      return 1;
    }

    int r (0);

    while (scan.more ())
    {
      string a (scan.next ());

      // Make sure options after the first file are not taken for files.
      //
      if (!a.empty () && a[0] == '-')
      {
        e << argv[0] << ": error: unexpected option '" << a << "' after "
          << "input file" << endl;
        return 1;
      }

      path file;

      try
      {
        file = path (a);
      }
      catch (invalid_path const&)
      {
        e << argv[0] << ": error: '" << a << "' is not a valid filesystem "
          << "path" << endl;
        return 1;
      }

      try
      {
        parser p (ops);
        auto_ptr<semantics::unit> u (p.parse (file));

        validator v;
        v.validate (ops, *u, file);

        generator g;
        g.generate (ops, *u, file);
      }
      catch (parser::failed const&)
      {
        // Diagnostics has aready been issued.
        //
        r = 1;
      }
      catch (validator::failed const&)
      {
        // Diagnostics has aready been issued.
        //
        r = 1;
      }
      catch (generator::failed const&)
      {
        // Diagnostics has aready been issued.
        //
        r = 1;
      }
    }

    return r;
  }
  catch (cli::exception const& ex)
  {
    e << ex << endl;
    return 1;
  }
}
