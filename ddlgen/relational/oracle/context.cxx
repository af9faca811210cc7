// file      : ddlgen/relational/oracle/context.cxx
// copyright : Copyright (c) 2009-2013 Code Synthesis Tools CC
// license   : GNU GPL v3; see accompanying LICENSE file

#include <cassert>

#include <ddlgen/relational/oracle/context.hxx>

using namespace std;

namespace relational
{
  namespace oracle
  {
    namespace
    {
      typedef relational::context::type_map_entry type_map_entry;

      type_map_entry const type_map[] =
      {
        {"BIGINT", "NUMBER(19)", context::param_none},
        {"BINARY", "RAW", context::param_fixed_length},
        {"BIT", "NUMBER(1)", context::param_none},
        {"BLOB", "BLOB", context::param_none},
        {"BOOLEAN", "NUMBER(1)", context::param_none},
        {"CHAR", "CHAR", context::param_fixed_length},
        {"CLOB", "CLOB", context::param_none},
        {"DATE", "DATE", context::param_none},
        {"DECIMAL", "NUMBER", context::param_precision},
        {"DOUBLE", "DOUBLE PRECISION", context::param_none},
        {"FLOAT", "FLOAT", context::param_none},
        {"INTEGER", "INTEGER", context::param_none},
        {"LONGVARBINARY", "BLOB", context::param_none},
        {"LONGVARCHAR", "CLOB", context::param_none},
        {"NUMERIC", "NUMBER", context::param_precision},
        {"REAL", "REAL", context::param_none},
        {"SMALLINT", "NUMBER(5)", context::param_none},
        {"TIME", "DATE", context::param_none},
        {"TIMESTAMP", "TIMESTAMP", context::param_none},
        {"TINYINT", "NUMBER(3)", context::param_none},
        {"VARBINARY", "RAW", context::param_variable_length},
        {"VARCHAR", "VARCHAR2", context::param_variable_length}
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
