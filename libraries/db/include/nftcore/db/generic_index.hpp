/*
 * Copyright (c) 2023 Michel Santos and contributors.
 *
 * The MIT License
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in
 * all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN
 * THE SOFTWARE.
 */
#pragma once

#include <nftcore/db/object.hpp>

#include <fc/exception/exception.hpp>

#include <boost/multi_index_container.hpp>
#include <boost/multi_index/member.hpp>
#include <boost/multi_index/ordered_index.hpp>

#include <functional>
#include <map>
#include <set>

namespace nftcore {
   namespace db {
      using boost::multi_index_container;
      using namespace boost::multi_index;

      struct by_id;

      /**
       * @brief Type-erased view of an index used to drive undo sessions
       *
       * At most one undo session is active at a time.  Every create, modify and remove made while
       * a session is active is reverted by undo() and kept by commit().
       */
      class index {
      public:
         virtual ~index() {}

         virtual void start_undo_session() = 0;
         virtual void undo() = 0;
         virtual void commit() = 0;
         virtual size_t size()const = 0;
      };

      /**
       * @brief Index interface for a single object type
       */
      template<typename ObjectType>
      class typed_index : public index {
      public:
         typedef ObjectType object_type;

         virtual const object_type& create( const std::function<void(object_type&)>& constructor ) = 0;
         virtual void modify( const object_type& obj, const std::function<void(object_type&)>& modifier ) = 0;
         virtual void remove( const object_type& obj ) = 0;
         virtual const object_type* find( object_id_type id )const = 0;
      };

      /**
       * @brief Stores objects in a boost::multi_index_container and records undo state
       *
       * The first index of @p MultiIndexType must be an ordered_unique index over object::id.
       */
      template<typename ObjectType, typename MultiIndexType>
      class generic_index : public typed_index<ObjectType> {
      public:
         typedef ObjectType object_type;
         typedef MultiIndexType index_type;

         const object_type& create( const std::function<void(object_type&)>& constructor ) override {
            object_type obj;
            constructor( obj );
            obj.id = _next_id;
            auto result = _indices.insert( std::move( obj ) );
            FC_ASSERT( result.second, "Could not create object! Most likely a uniqueness constraint is violated." );
            ++_next_id;
            if( _undo_active )
               _new_ids.insert( result.first->id );
            return *result.first;
         }

         void modify( const object_type& obj, const std::function<void(object_type&)>& modifier ) override {
            auto itr = _indices.find( obj.id );
            FC_ASSERT( itr != _indices.end(), "Could not find object ${id} to modify", ("id", obj.id) );
            save_old_value( *itr );
            bool ok = _indices.modify( itr, [&modifier]( object_type& o ) { modifier( o ); } );
            FC_ASSERT( ok, "Could not modify object, most likely a uniqueness constraint was violated" );
         }

         void remove( const object_type& obj ) override {
            auto itr = _indices.find( obj.id );
            FC_ASSERT( itr != _indices.end(), "Could not find object ${id} to remove", ("id", obj.id) );
            if( _undo_active ) {
               const object_id_type id = itr->id;
               if( _new_ids.erase( id ) == 0 ) {
                  auto old = _old_values.find( id );
                  if( old != _old_values.end() ) {
                     _removed_values.emplace( id, old->second );
                     _old_values.erase( old );
                  } else {
                     _removed_values.emplace( id, *itr );
                  }
               }
            }
            _indices.erase( itr );
         }

         const object_type* find( object_id_type id )const override {
            auto itr = _indices.find( id );
            if( itr == _indices.end() )
               return nullptr;
            return &*itr;
         }

         const index_type& indices()const { return _indices; }
         size_t size()const override { return _indices.size(); }

         void start_undo_session() override {
            FC_ASSERT( !_undo_active, "An undo session is already active" );
            _undo_active = true;
            _saved_next_id = _next_id;
         }

         void undo() override {
            if( !_undo_active )
               return;
            for( object_id_type id : _new_ids )
               _indices.erase( id );
            for( const auto& entry : _old_values )
               _indices.erase( entry.first );
            for( const auto& entry : _old_values )
               _indices.insert( entry.second );
            for( const auto& entry : _removed_values )
               _indices.insert( entry.second );
            _next_id = _saved_next_id;
            reset_undo_state();
         }

         void commit() override {
            reset_undo_state();
         }

      private:
         void save_old_value( const object_type& obj ) {
            if( !_undo_active || _new_ids.count( obj.id ) || _old_values.count( obj.id ) )
               return;
            _old_values.emplace( obj.id, obj );
         }

         void reset_undo_state() {
            _undo_active = false;
            _new_ids.clear();
            _old_values.clear();
            _removed_values.clear();
         }

         index_type _indices;
         object_id_type _next_id = 0;

         bool _undo_active = false;
         object_id_type _saved_next_id = 0;
         std::set<object_id_type> _new_ids;
         std::map<object_id_type, object_type> _old_values;
         std::map<object_id_type, object_type> _removed_values;
      };
   }
} // nftcore::db
