// file      : ddlgen/context.hxx
// copyright : Copyright (c) 2009-2013 Code Synthesis Tools CC
// license   : GNU GPL v3; see accompanying LICENSE file

#ifndef DDLGEN_CONTEXT_HXX
#define DDLGEN_CONTEXT_HXX

#include <map>
#include <set>
#include <stack>
#include <memory>  // std::auto_ptr
#include <string>
#include <vector>
#include <ostream>
#include <cstddef> // std::size_t
#include <iostream>

#include <cutl/shared-ptr.hxx>

#include <ddlgen/options.hxx>
#include <ddlgen/semantics.hxx>
#include <ddlgen/traversal.hxx>

using std::endl;
using std::cerr;

// Thrown after the diagnostics have been issued.
//
struct operation_failed {};

// Resolving the identity of a class led back to the class through the
// types of its identity members.
//
struct identity_cycle
{
  identity_cycle (semantics::class_& c): c (c) {}

  semantics::class_& c;
};

class context
{
public:
  typedef std::size_t size_t;
  typedef std::string string;
  typedef std::ostream ostream;
  typedef semantics::strings strings;

  typedef ::options options_type;

  static string
  upcase (string const&);

  // Mapping attributes.
  //
public:
  // A class without a table mapping is not persisted.
  //
  static bool
  persistent (semantics::class_& c)
  {
    return c.count ("table") != 0;
  }

  static string const&
  table_name (semantics::class_& c)
  {
    return c.get<string> ("table");
  }

  // Synthesized class that represents a many-to-many junction table.
  //
  static bool
  junction (semantics::class_& c)
  {
    return c.count ("junction") != 0;
  }

  // A member without SQL mapping is not persisted.
  //
  static bool
  persistent (semantics::data_member& m)
  {
    return m.count ("sql") != 0;
  }

  static bool
  many_to_many (semantics::data_member& m)
  {
    return m.count ("many-table") != 0;
  }

  static bool
  required (semantics::data_member& m)
  {
    return m.get<bool> ("required", false);
  }

  // Type name that should be used to resolve the member's SQL type.
  // This is the SQL type override, if any, or the declared type.
  //
  static string const&
  sql_type (semantics::data_member& m)
  {
    return m.count ("sql-type") ? m.get<string> ("sql-type") : m.type ();
  }

  // Identity.
  //
public:
  typedef std::vector<semantics::data_member*> data_members;

  // Return true if at least one member of the class is explicitly
  // marked as identity. In this case the identity attribute on the
  // class is ignored.
  //
  static bool
  explicit_identity (semantics::class_&);

  static bool
  identity (semantics::class_&, semantics::data_member&);

  // Identity members declared in this class (bases are not considered).
  //
  static data_members
  identity_members (semantics::class_&);

  // Return 0 if there is no class with this name.
  //
  semantics::class_*
  find_class (string const& name) const;

  // Type names of the identity columns, one per column. References to
  // other classes are resolved to their identity types. A class that
  // declares no identity of its own uses its base's.
  //
  strings
  identity_types (semantics::class_&);

  // Column names of the identity members. If inherited is true and the
  // class declares no identity of its own, return the base's.
  //
  strings
  identity_columns (semantics::class_&, bool inherited);

  // Column names of a persistent member. These are the explicitly
  // specified names or, if there are none, the names derived from the
  // member name.
  //
  strings
  column_names (semantics::data_member&);

  // The above functions throw identity_cycle if a class identity refers
  // to itself.
  //
private:
  typedef std::set<semantics::class_*> class_set;

  strings
  identity_types (semantics::class_&, class_set&);

  strings
  identity_columns (semantics::class_&, bool, class_set&);

  strings
  column_names (semantics::data_member&, class_set&);

  // Diverge output.
  //
public:
  void
  diverge (std::ostream& os)
  {
    diverge (os.rdbuf ());
  }

  void
  diverge (std::streambuf* sb);

  void
  restore ();

protected:
  struct data;
  typedef cutl::shared_ptr<data> data_ptr;
  data_ptr data_;

public:
  std::ostream& os;
  semantics::unit& unit;
  options_type const& options;
  database const db;

protected:
  struct data
  {
    virtual
    ~data () {}
    data (std::ostream& os): os_ (os.rdbuf ()) {}

  public:
    std::ostream os_;
    std::stack<std::streambuf*> os_stack_;
  };

public:
  typedef context root_context;

  virtual
  ~context ();
  context ();
  context (std::ostream&,
           semantics::unit&,
           options_type const&,
           data_ptr = data_ptr ());

  static context&
  current ()
  {
    return *current_;
  }

private:
  static context* current_;

private:
  context&
  operator= (context const&);
};

namespace semantics
{
  namespace relational
  {
    class model;
  }
}

// Create the database-specific context. The model is only available
// after the schema has been built.
//
std::auto_ptr<context>
create_context (std::ostream&,
                semantics::unit&,
                options const&,
                semantics::relational::model*);

#endif // DDLGEN_CONTEXT_HXX
