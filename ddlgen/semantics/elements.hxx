// file      : ddlgen/semantics/elements.hxx
// copyright : Copyright (c) 2009-2013 Code Synthesis Tools CC
// license   : GNU GPL v3; see accompanying LICENSE file

#ifndef DDLGEN_SEMANTICS_ELEMENTS_HXX
#define DDLGEN_SEMANTICS_ELEMENTS_HXX

#include <map>
#include <list>
#include <vector>
#include <string>
#include <cstddef> // std::size_t
#include <cassert>

#include <cutl/fs/path.hxx>
#include <cutl/container/graph.hxx>
#include <cutl/container/pointer-iterator.hxx>
#include <cutl/compiler/context.hxx>

namespace semantics
{
  using namespace cutl;

  using std::size_t;
  using std::string;

  using container::graph;
  using container::pointer_iterator;

  using compiler::context;

  //
  //
  using fs::path;

  //
  //
  typedef std::vector<string> strings;

  //
  //
  class node;
  class edge;

  //
  //
  class edge: public context
  {
  public:
    virtual
    ~edge () {}
  };

  //
  //
  class node: public context
  {
  public:
    virtual
    ~node () {}

  public:
    path const&
    file () const
    {
      return file_;
    }

    size_t
    line () const
    {
      return line_;
    }

    size_t
    column () const
    {
      return column_;
    }

  public:
    // Location in the mapping document.
    //
    node (path const& file, size_t line, size_t column)
        : file_ (file), line_ (line), column_ (column)
    {
    }

    // Sink functions that allow extensions in the form of one-way
    // edges.
    //
    void
    add_edge_right (edge&)
    {
    }

  protected:
    // For virtual inheritance. The most derived class always
    // initializes the node with its location.
    //
    node ()
        : line_ (0), column_ (0)
    {
    }

  private:
    path file_;
    size_t line_;
    size_t column_;
  };

  //
  //
  class scope;
  class nameable;

  //
  //
  class names: public edge
  {
  public:
    typedef semantics::scope scope_type;
    typedef semantics::nameable nameable_type;

    string const&
    name () const
    {
      return name_;
    }

    scope_type&
    scope () const
    {
      return *scope_;
    }

    nameable_type&
    named () const
    {
      return *named_;
    }

  public:
    names (string const& name): name_ (name), scope_ (0), named_ (0) {}

    void
    set_left_node (scope_type& n)
    {
      scope_ = &n;
    }

    void
    set_right_node (nameable_type& n)
    {
      named_ = &n;
    }

  protected:
    string name_;
    scope_type* scope_;
    nameable_type* named_;
  };

  //
  //
  class nameable: public virtual node
  {
  public:
    typedef semantics::scope scope_type;

    string const&
    name () const
    {
      return named_->name ();
    }

    scope_type&
    scope () const
    {
      return named_->scope ();
    }

    names&
    named () const
    {
      return *named_;
    }

  public:
    nameable (): named_ (0) {}

    void
    add_edge_right (names& e)
    {
      assert (named_ == 0);
      named_ = &e;
    }

    using node::add_edge_right;

  private:
    names* named_;
  };

  //
  //
  class scope: public virtual node
  {
  protected:
    typedef std::list<names*> names_list;
    typedef std::map<string, names_list::iterator> names_map;

  public:
    typedef pointer_iterator<names_list::iterator> names_iterator;
    typedef
    pointer_iterator<names_list::const_iterator>
    names_const_iterator;

  public:
    names_iterator
    names_begin ()
    {
      return names_.begin ();
    }

    names_iterator
    names_end ()
    {
      return names_.end ();
    }

    names_const_iterator
    names_begin () const
    {
      return names_.begin ();
    }

    names_const_iterator
    names_end () const
    {
      return names_.end ();
    }

    names_list::size_type
    names_size () const
    {
      return names_.size ();
    }

    // Find a nameable of type T with the specified name. Return 0 if
    // there is no such nameable.
    //
    template <typename T>
    T*
    find (string const& name) const
    {
      names_map::const_iterator i (names_map_.find (name));
      return i != names_map_.end ()
        ? dynamic_cast<T*> (&(*i->second)->named ())
        : 0;
    }

  public:
    scope () {}

    void
    add_edge_left (names&);

    using node::add_edge_right;

  private:
    names_list names_;
    names_map names_map_;
  };
}

#endif // DDLGEN_SEMANTICS_ELEMENTS_HXX
