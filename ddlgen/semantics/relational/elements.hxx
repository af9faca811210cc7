// file      : ddlgen/semantics/relational/elements.hxx
// copyright : Copyright (c) 2009-2013 Code Synthesis Tools CC
// license   : GNU GPL v3; see accompanying LICENSE file

#ifndef DDLGEN_SEMANTICS_RELATIONAL_ELEMENTS_HXX
#define DDLGEN_SEMANTICS_RELATIONAL_ELEMENTS_HXX

#include <map>
#include <list>
#include <vector>
#include <string>
#include <cassert>

#include <cutl/container/graph.hxx>
#include <cutl/container/pointer-iterator.hxx>
#include <cutl/compiler/context.hxx>

namespace semantics
{
  namespace relational
  {
    using namespace cutl;

    using std::string;

    using container::graph;
    using container::pointer_iterator;

    using compiler::context;

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

    class node: public context
    {
    public:
      virtual
      ~node () {}

      // Return name of the node.
      //
      virtual string
      kind () const = 0;

    public:
      template <typename X>
      bool
      is_a () const
      {
        return dynamic_cast<X const*> (this) != 0;
      }

      // Sink functions that allow extensions in the form of one-way
      // edges.
      //
    public:
      void
      add_edge_right (edge&)
      {
      }
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
      typedef relational::scope scope_type;
      typedef relational::nameable nameable_type;

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
      nameable () const
      {
        return *nameable_;
      }

    public:
      names (string const& name): name_ (name), scope_ (0), nameable_ (0) {}

      void
      set_left_node (scope_type& n)
      {
        scope_ = &n;
      }

      void
      set_right_node (nameable_type& n)
      {
        nameable_ = &n;
      }

    protected:
      string name_;
      scope_type* scope_;
      nameable_type* nameable_;
    };

    //
    //
    class nameable: public virtual node
    {
    public:
      typedef relational::scope scope_type;

      string const&
      name () const
      {
        return named_->name ();
      }

      scope_type&
      scope () const
      {
        return named ().scope ();
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
    struct duplicate_name
    {
      typedef relational::scope scope_type;
      typedef relational::nameable nameable_type;

      duplicate_name (scope_type& s, nameable_type& o, nameable_type& d)
          : scope (s), orig (o), dup (d), name (o.name ())
      {
      }

      scope_type& scope;
      nameable_type& orig;
      nameable_type& dup;
      string name;
    };

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
      // Iteration.
      //
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

      // Return 0 if there is no nameable of type T with this name.
      //
      template <typename T>
      T*
      find (string const& name) const
      {
        names_map::const_iterator i (names_map_.find (name));
        return i != names_map_.end ()
          ? dynamic_cast<T*> (&(*i->second)->nameable ())
          : 0;
      }

    public:
      scope (): keys_ (names_.end ()) {}

      // Columns are kept in declaration order ahead of the primary key,
      // which is followed by foreign keys and indexes. Throw
      // duplicate_name if the name is already used in this scope.
      //
      void
      add_edge_left (names&);

    private:
      names_list names_;
      names_map names_map_;

      // First non-column entry.
      //
      names_list::iterator keys_;
    };
  }
}

#endif // DDLGEN_SEMANTICS_RELATIONAL_ELEMENTS_HXX
