// file      : ddlgen/relational/pgsql/context.cxx
// copyright : Copyright (c) 2009-2013 Code Synthesis Tools CC
// license   : GNU GPL v3; see accompanying LICENSE file

#include <cassert>

#include <ddlgen/relational/pgsql/context.hxx>

using namespace std;

namespace relational
{
  namespace pgsql
  {
    namespace
    {
      typedef relational::context::type_map_entry type_map_entry;

      type_map_entry const type_map[] =
      {
        {"BIGINT", "BIGINT", context::param_none},
        {"BINARY", "BYTEA", context::param_none},
        {"BIT", "BOOLEAN", context::param_none},
        {"BLOB", "BYTEA", context::param_none},
        {"BOOLEAN", "BOOLEAN", context::param_none},
        {"CHAR", "CHAR", context::param_fixed_length},
        {"CLOB", "TEXT", context::param_none},
        {"DATE", "DATE", context::param_none},
        {"DECIMAL", "NUMERIC", context::param_precision},
        {"DOUBLE", "DOUBLE PRECISION", context::param_none},
        {"FLOAT", "REAL", context::param_none},
        {"INTEGER", "INTEGER", context::param_none},
        {"LONGVARBINARY", "BYTEA", context::param_none},
        {"LONGVARCHAR", "TEXT", context::param_none},
        {"NUMERIC", "NUMERIC", context::param_precision},
        {"REAL", "REAL", context::param_none},
        {"SMALLINT", "SMALLINT", context::param_none},
        {"TIME", "TIME", context::param_none},
        {"TIMESTAMP", "TIMESTAMP", context::param_none},
        {"TINYINT", "SMALLINT", context::param_none},
        {"VARBINARY", "BYTEA", context::param_none},
        {"VARCHAR", "VARCHAR", context::param_variable_length}
      };
    }

    context* context::current_;

    context::
    ~context ()
    {
      if (current_ == this)
        current_ = 0;
    }

    context::
    context (ostream& os,
             semantics::unit& u,
             options_type const& ops,
             sema_rel::model* m)
        : root_context (os, u, ops, data_ptr (new (shared) data (os))),
          base_context (static_cast<data*> (root_context::data_.get ()), m),
          data_ (static_cast<data*> (base_context::data_))
    {
      assert (current_ == 0);
      current_ = this;

      // Populate the mapping type to DB type map.
      //
      populate (type_map, sizeof (type_map) / sizeof (type_map_entry));
    }

    context::
    context ()
        : data_ (current ().data_)
    {
    }
  }
}
