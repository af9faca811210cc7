// file      : ddlgen/relational/context.ixx
// copyright : Copyright (c) 2009-2013 Code Synthesis Tools CC
// license   : GNU GPL v3; see accompanying LICENSE file

namespace relational
{
  inline context::string context::
  quote_string (string const& str) const
  {
    return current ().quote_string_impl (str);
  }

  inline context::string context::
  quote_id (string const& id) const
  {
    return options.quote_identifiers () ? current ().quote_id_impl (id) : id;
  }
}
