// file      : ddlgen/relational/context.hxx
// copyright : Copyright (c) 2009-2013 Code Synthesis Tools CC
// license   : GNU GPL v3; see accompanying LICENSE file

#ifndef DDLGEN_RELATIONAL_CONTEXT_HXX
#define DDLGEN_RELATIONAL_CONTEXT_HXX

#include <map>

#include <ddlgen/context.hxx>

#include <ddlgen/semantics/relational.hxx>
#include <ddlgen/traversal/relational.hxx>

namespace relational
{
  namespace sema_rel = semantics::relational;
  namespace trav_rel = traversal::relational;

  class context: public virtual ::context
  {
  public:
    // Quote SQL string.
    //
    string
    quote_string (string const&) const;

    // Quote SQL identifier. Identifiers are only quoted if requested
    // with --quote-identifiers.
    //
    string
    quote_id (string const&) const;

    // Map a type name from the mapping document (for example, varchar,
    // string, or numeric(12,2)) to the database type as it should appear
    // in DDL. Return empty string if there is no mapping.
    //
    string
    database_type (string const&);

    // Return true if the values of this column are generated by the
    // database, that is, it is the only column of the primary key and
    // the table uses the IDENTITY key generator.
    //
    static bool
    auto_column (sema_rel::column&);

    // Name of the sequence used by the table's key generator. It is the
    // value of the sequence parameter (by default {0}_seq) with {0}
    // replaced by the table name.
    //
    static string
    sequence_name (sema_rel::table&);

  protected:
    // The default implementation uses the ISO quoting ('') and
    // escapes singe quotes inside the string by double-quoting
    // (' -> '').
    //
    virtual string
    quote_string_impl (string const&) const;

    // The default implementation uses the ISO quoting ("").
    //
    virtual string
    quote_id_impl (string const&) const;

    // The default implementation uses the type map populated by the
    // database-specific context. The name is upper-case with aliases
    // resolved. The arguments are what appeared in the parenthesis, if
    // anything.
    //
    virtual string
    database_type_impl (string const& name, string const& args);

  public:
    // How the type arguments are derived if not specified.
    //
    enum param_kind
    {
      param_none,
      param_fixed_length,    // --char-length
      param_variable_length, // --varchar-length
      param_precision        // --numeric-precision, --numeric-scale
    };

    struct type_map_entry
    {
      const char* const name;
      const char* const db_type;
      param_kind const kind;
    };

  public:
    virtual
    ~context ();
    context ();

    static context&
    current ()
    {
      return *current_;
    }

  protected:
    struct data;
    typedef context base_context;

    context (data*, sema_rel::model*);

  private:
    static context* current_;

  protected:
    struct db_type_type
    {
      db_type_type () {}
      db_type_type (string const& t, param_kind k): type (t), kind (k) {}

      string type;
      param_kind kind;
    };

    typedef std::map<string, db_type_type> type_map_type;

    struct data: root_context::data
    {
      data (std::ostream& os): root_context::data (os) {}

      type_map_type type_map_;
    };

    void
    populate (type_map_entry const*, size_t n);

    data* data_;

  public:
    sema_rel::model* model;
  };
}

#include <ddlgen/relational/context.ixx>

#endif // DDLGEN_RELATIONAL_CONTEXT_HXX
