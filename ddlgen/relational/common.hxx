// file      : ddlgen/relational/common.hxx
// copyright : Copyright (c) 2009-2013 Code Synthesis Tools CC
// license   : GNU GPL v3; see accompanying LICENSE file

#ifndef DDLGEN_RELATIONAL_COMMON_HXX
#define DDLGEN_RELATIONAL_COMMON_HXX

#include <map>

#include <ddlgen/relational/context.hxx>

namespace relational
{
  //
  // Database-specific overrides.
  //
  // A dialect overrides B by deriving D from B and its own context and
  // defining a static entry<D> object. The database is taken from the
  // database_id constant of the dialect context.
  //

  template <typename B>
  struct factory
  {
    typedef B* (*create_func) (B const&);
    typedef std::map<database::value, create_func> map;

    static B*
    create (B const& prototype)
    {
      map const& m (overrides ());
      typename map::const_iterator i (
        m.find (context::current ().options.database ()));

      return i != m.end () ? i->second (prototype) : new B (prototype);
    }

    // Entries register from static initializers so the map cannot be
    // a static data member.
    //
    static map&
    overrides ()
    {
      static map m;
      return m;
    }
  };

  template <typename D>
  struct entry
  {
    typedef typename D::base base;

    entry ()
    {
      database::value db (D::database_id);
      factory<base>::overrides ()[db] = &create;
    }

    static base*
    create (base const& prototype)
    {
      return new D (prototype);
    }
  };

  // Create the override of B for the current database, or B itself if
  // there is none.
  //
  template <typename B>
  struct instance
  {
    instance ()
    {
      B prototype;
      x_ = factory<B>::create (prototype);
    }

    template <typename A1>
    instance (A1& a1)
    {
      B prototype (a1);
      x_ = factory<B>::create (prototype);
    }

    template <typename A1, typename A2, typename A3>
    instance (A1& a1, A2& a2, A3& a3)
    {
      B prototype (a1, a2, a3);
      x_ = factory<B>::create (prototype);
    }

    ~instance ()
    {
      delete x_;
    }

    B*
    operator-> () const {return x_;}

    B&
    operator* () const {return *x_;}

  private:
    instance (instance const&);
    instance& operator= (instance const&);

  private:
    B* x_;
  };

  template <typename T>
  inline traversal::node_base&
  operator>> (traversal::edge_base& e, instance<T>& n)
  {
    e.node_traverser (*n);
    return *n;
  }
}

#endif // DDLGEN_RELATIONAL_COMMON_HXX
