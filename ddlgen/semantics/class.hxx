// file      : ddlgen/semantics/class.hxx
// copyright : Copyright (c) 2009-2013 Code Synthesis Tools CC
// license   : GNU GPL v3; see accompanying LICENSE file

#ifndef DDLGEN_SEMANTICS_CLASS_HXX
#define DDLGEN_SEMANTICS_CLASS_HXX

#include <ddlgen/semantics/elements.hxx>

namespace semantics
{
  // Persistent field. The declared type is either a SQL/primitive type
  // name or the name of another persistent class. The mapping attributes
  // (column names, identity, many-table, etc) are stored in the context.
  //
  class data_member: public nameable
  {
  public:
    string const&
    type () const
    {
      return type_;
    }

  public:
    data_member (path const& file,
                 size_t line,
                 size_t column,
                 string const& type)
        : node (file, line, column), type_ (type)
    {
    }

  private:
    string type_;
  };

  // Index declared on a persistent class. The members are names of the
  // class data members whose columns make up the index.
  //
  struct index
  {
    index (): line (0), column (0), unique (false) {}

    path file;
    size_t line;
    size_t column;

    string name; // Empty if not specified.
    bool unique;
    strings members;
  };

  typedef std::vector<index> indexes;

  //
  //
  class class_;

  class inherits: public edge
  {
  public:
    typedef semantics::class_ class_type;

    class_type&
    derived () const
    {
      return *derived_;
    }

    class_type&
    base () const
    {
      return *base_;
    }

  public:
    inherits (): derived_ (0), base_ (0) {}

    void
    set_left_node (class_type& n)
    {
      derived_ = &n;
    }

    void
    set_right_node (class_type& n)
    {
      base_ = &n;
    }

  protected:
    class_type* derived_;
    class_type* base_;
  };

  // Persistent class. Names its data members in declaration order.
  //
  class class_: public scope, public nameable
  {
  public:
    // Return 0 if this class does not extend another class.
    //
    class_*
    base () const
    {
      return inherits_ != 0 ? &inherits_->base () : 0;
    }

  public:
    class_ (path const& file, size_t line, size_t column)
        : node (file, line, column), inherits_ (0)
    {
    }

    void
    add_edge_left (inherits& e)
    {
      assert (inherits_ == 0);
      inherits_ = &e;
    }

    void
    add_edge_right (inherits&)
    {
    }

    using scope::add_edge_left;
    using nameable::add_edge_right;

  private:
    inherits* inherits_;
  };
}

#endif // DDLGEN_SEMANTICS_CLASS_HXX
