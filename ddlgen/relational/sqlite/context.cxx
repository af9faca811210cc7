// file      : ddlgen/relational/sqlite/context.cxx
// copyright : Copyright (c) 2009-2013 Code Synthesis Tools CC
// license   : GNU GPL v3; see accompanying LICENSE file

#include <cassert>

#include <ddlgen/relational/sqlite/context.hxx>

using namespace std;

namespace relational
{
  namespace sqlite
  {
    namespace
    {
      typedef relational::context::type_map_entry type_map_entry;

      type_map_entry const type_map[] =
      {
        {"BIGINT", "INTEGER", context::param_none},
        {"BINARY", "BLOB", context::param_none},
        {"BIT", "INTEGER", context::param_none},
        {"BLOB", "BLOB", context::param_none},
        {"BOOLEAN", "INTEGER", context::param_none},
        {"CHAR", "TEXT", context::param_none},
        {"CLOB", "TEXT", context::param_none},
        {"DATE", "TEXT", context::param_none},
        {"DECIMAL", "NUMERIC", context::param_none},
        {"DOUBLE", "REAL", context::param_none},
        {"FLOAT", "REAL", context::param_none},
        {"INTEGER", "INTEGER", context::param_none},
        {"LONGVARBINARY", "BLOB", context::param_none},
        {"LONGVARCHAR", "TEXT", context::param_none},
        {"NUMERIC", "NUMERIC", context::param_none},
        {"REAL", "REAL", context::param_none},
        {"SMALLINT", "INTEGER", context::param_none},
        {"TIME", "TEXT", context::param_none},
        {"TIMESTAMP", "TEXT", context::param_none},
        {"TINYINT", "INTEGER", context::param_none},
        {"VARBINARY", "BLOB", context::param_none},
        {"VARCHAR", "TEXT", context::param_none}
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
