// file      : ddlgen/semantics/unit.hxx
// copyright : Copyright (c) 2009-2013 Code Synthesis Tools CC
// license   : GNU GPL v3; see accompanying LICENSE file

#ifndef DDLGEN_SEMANTICS_UNIT_HXX
#define DDLGEN_SEMANTICS_UNIT_HXX

#include <ddlgen/semantics/elements.hxx>
#include <ddlgen/semantics/key-generator.hxx>

namespace semantics
{
  // Mapping document. Names persistent classes in document order and
  // declares key generators.
  //
  class unit: public graph<node, edge>, public scope
  {
    typedef std::vector<declares*> declares_list;

  public:
    typedef
    pointer_iterator<declares_list::const_iterator>
    declares_iterator;

    declares_iterator
    declares_begin () const
    {
      return declares_.begin ();
    }

    declares_iterator
    declares_end () const
    {
      return declares_.end ();
    }

  public:
    unit (path const& file)
        : node (file, 1, 1)
    {
    }

    void
    add_edge_left (declares& e)
    {
      declares_.push_back (&e);
    }

    using scope::add_edge_left;

  private:
    unit (unit const&);
    unit& operator= (unit const&);

  private:
    declares_list declares_;
  };
}

#endif // DDLGEN_SEMANTICS_UNIT_HXX
