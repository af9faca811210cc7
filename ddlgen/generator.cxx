// file      : ddlgen/generator.cxx
// copyright : Copyright (c) 2009-2013 Code Synthesis Tools CC
// license   : GNU GPL v3; see accompanying LICENSE file

#include <fstream>
#include <iostream>

#include <cutl/fs/auto-remove.hxx>

#include <ddlgen/context.hxx>
#include <ddlgen/generator.hxx>

#include <ddlgen/relational/generate.hxx>

using namespace std;
using namespace cutl;

using semantics::path;

namespace
{
  void
  open (ofstream& ofs, path const& p)
  {
    ofs.open (p.string ().c_str (), ios_base::out);

    if (!ofs.is_open ())
    {
      cerr << p << ": error: unable to open in write mode" << endl;
      throw generator::failed ();
    }
  }
}

void generator::
generate (options const& ops, semantics::unit& unit, ostream& os)
{
  try
  {
    // Build the schema model. The context is only used for building
    // and is destroyed before the one for emission is created.
    //
    cutl::shared_ptr<semantics::relational::model> model;
    {
      auto_ptr<context> ctx (create_context (cerr, unit, ops, 0));
      model = relational::model::generate ();
    }

    auto_ptr<context> ctx (create_context (os, unit, ops, model.get ()));
    relational::schema::generate ();
  }
  catch (operation_failed const&)
  {
    // Diagnostics has already been issued.
    //
    throw failed ();
  }
}

void generator::
generate (options const& ops, semantics::unit& unit, path const& p)
{
  if (ops.output_stdout ())
  {
    generate (ops, unit, cout);

    if (!cout)
    {
      cerr << "error: write failure" << endl;
      throw failed ();
    }

    return;
  }

  // Output file name.
  //
  path file (p.leaf ());
  string base (file.base ().string ());

  path sql_path (base + ops.sql_suffix () + ".sql");

  if (!ops.output_dir ().empty ())
    sql_path = path (ops.output_dir ()) / sql_path;

  // Remove the output file if we fail.
  //
  fs::auto_removes auto_rm;

  ofstream sql;
  open (sql, sql_path);
  auto_rm.add (sql_path);

  generate (ops, unit, sql);

  sql.flush ();

  if (!sql)
  {
    cerr << sql_path << ": error: write failure" << endl;
    throw failed ();
  }

  auto_rm.cancel ();
}
