// file      : ddlgen/semantics/relational/key.hxx
// copyright : Copyright (c) 2009-2013 Code Synthesis Tools CC
// license   : GNU GPL v3; see accompanying LICENSE file

#ifndef DDLGEN_SEMANTICS_RELATIONAL_KEY_HXX
#define DDLGEN_SEMANTICS_RELATIONAL_KEY_HXX

#include <ddlgen/semantics/relational/elements.hxx>

namespace semantics
{
  namespace relational
  {
    class key;
    class column;

    class contains: public edge
    {
    public:
      typedef relational::key key_type;
      typedef relational::column column_type;

      key_type&
      key () const
      {
        return *key_;
      }

      column_type&
      column () const
      {
        return *column_;
      }

    public:
      contains (): key_ (0), column_ (0) {}

      void
      set_left_node (key_type& n)
      {
        key_ = &n;
      }

      void
      set_right_node (column_type& n)
      {
        column_ = &n;
      }

    protected:
      key_type* key_;
      column_type* column_;
    };

    class key: public nameable
    {
      typedef std::vector<contains*> contains_list;

    public:
      typedef contains::column_type column_type;

      typedef
      pointer_iterator<contains_list::const_iterator>
      contains_iterator;

      contains_iterator
      contains_begin () const
      {
        return contains_.begin ();
      }

      contains_iterator
      contains_end () const
      {
        return contains_.end ();
      }

      contains_list::size_type
      contains_size () const
      {
        return contains_.size ();
      }

      bool
      contains_empty () const
      {
        return contains_.empty ();
      }

      // Return true if this key contains the column.
      //
      bool
      contains_column (column_type const&) const;

    public:
      key () {}

      void
      add_edge_left (contains& e)
      {
        contains_.push_back (&e);
      }

    private:
      contains_list contains_;
    };
  }
}

#endif // DDLGEN_SEMANTICS_RELATIONAL_KEY_HXX
