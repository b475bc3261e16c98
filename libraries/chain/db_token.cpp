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
#include <nftcore/chain/database.hpp>
#include <nftcore/protocol/token_id.hpp>

namespace nftcore {
   namespace chain {
      const collection_token_object* database::find_token( const address& collection,
                                                           const token_id_type& token_id )const {
         const auto& idx = get_index_type<collection_token_index>().indices().get<by_collection_token>();
         auto itr = idx.find( boost::make_tuple( collection, token_id ) );
         return itr == idx.end() ? nullptr : &*itr;
      }

      const collection_token_object& database::get_token( const address& collection,
                                                          const token_id_type& token_id )const {
         const collection_token_object* token = find_token( collection, token_id );
         NFTCORE_ASSERT( token != nullptr, invalid_token_id_exception,
                         "Token ${t} does not exist (INVALID_TOKEN_ID)", ("t", token_id)("collection", collection) );
         return *token;
      }

      address database::owner_of( const address& collection, const token_id_type& token_id )const {
         return get_token( collection, token_id ).owner;
      }

      uint64_t database::balance_of( const address& collection, const address& owner )const {
         FC_ASSERT( !owner.is_zero(), "ERC721: balance query for the zero address" );
         const auto& idx = get_index_type<collection_token_index>().indices().get<by_collection_owner>();
         auto range = idx.equal_range( boost::make_tuple( collection, owner ) );
         return std::distance( range.first, range.second );
      }

      address database::get_approved( const address& collection, const token_id_type& token_id )const {
         return get_token( collection, token_id ).approved;
      }

      bool database::is_approved_for_all( const address& collection, const address& owner,
                                          const address& operator_ )const {
         const auto& idx = get_index_type<collection_operator_index>().indices().get<by_collection_owner_operator>();
         return idx.find( boost::make_tuple( collection, owner, operator_ ) ) != idx.end();
      }

      bool database::is_approved_or_owner( const collection_token_object& token, const address& spender )const {
         return spender == token.owner || spender == token.approved
                || is_approved_for_all( token.collection, token.owner, spender );
      }

      uint64_t database::total_supply( const address& collection )const {
         return get_collection( collection ).tokens_count;
      }

      token_id_type database::token_by_index( const address& collection, uint64_t index )const {
         const auto& idx = get_index_type<collection_token_index>().indices().get<by_collection_sequence>();
         auto range = idx.equal_range( boost::make_tuple( collection ) );
         FC_ASSERT( index < static_cast<uint64_t>( std::distance( range.first, range.second ) ),
                    "ERC721Enumerable: global index out of bounds", ("index", index) );
         auto itr = range.first;
         std::advance( itr, index );
         return itr->token_id;
      }

      token_id_type database::token_of_owner_by_index( const address& collection, const address& owner,
                                                       uint64_t index )const {
         const auto& idx = get_index_type<collection_token_index>().indices().get<by_collection_owner>();
         auto range = idx.equal_range( boost::make_tuple( collection, owner ) );
         FC_ASSERT( index < static_cast<uint64_t>( std::distance( range.first, range.second ) ),
                    "ERC721Enumerable: owner index out of bounds", ("owner", owner)("index", index) );
         auto itr = range.first;
         std::advance( itr, index );
         return itr->token_id;
      }

      string database::token_uri( const address& collection, const token_id_type& token_id )const {
         const collection_object& c = get_collection( collection );
         const collection_token_object& token = get_token( collection, token_id );
         return c.base_uri + std::to_string( _chain_id ) + "/" + collection.to_string() + "/"
                + std::to_string( token.item_id ) + "/" + token.issued_id.str();
      }

      void database::mint_token( const collection_object& collection, const address& to, const token_id_type& token_id ) {
         NFTCORE_ASSERT( !to.is_zero(), mint_to_zero_address_exception,
                         "ERC721: mint to the zero address", ("token_id", token_id) );
         NFTCORE_ASSERT( find_token( collection.collection, token_id ) == nullptr, invalid_token_id_exception,
                         "ERC721: token already minted", ("token_id", token_id) );

         const token_id_parts parts = decode_token_id( token_id );
         create<collection_token_object>( [&]( collection_token_object& obj ) {
            obj.collection = collection.collection;
            obj.token_id = token_id;
            obj.item_id = parts.item_id;
            obj.issued_id = parts.issued_id;
            obj.owner = to;
         });
         modify( collection, []( collection_object& obj ) {
            ++obj.tokens_count;
         });

         token_transferred_operation vop;
         vop.collection = collection.collection;
         vop.to = to;
         vop.token_id = token_id;
         push_applied_operation( vop );
      }

      void database::transfer_token( const collection_token_object& token, const address& to ) {
         NFTCORE_ASSERT( !to.is_zero(), transfer_to_zero_address_exception,
                         "ERC721: transfer to the zero address", ("token_id", token.token_id) );

         token_transferred_operation vop;
         vop.collection = token.collection;
         vop.from = token.owner;
         vop.to = to;
         vop.token_id = token.token_id;

         // Clear approvals from the previous owner
         modify( token, [&to]( collection_token_object& obj ) {
            obj.owner = to;
            obj.approved = address();
         });
         push_applied_operation( vop );
      }

      void database::set_token_approval( const collection_token_object& token, const address& approved ) {
         modify( token, [&approved]( collection_token_object& obj ) {
            obj.approved = approved;
         });

         token_approved_operation vop;
         vop.collection = token.collection;
         vop.owner = token.owner;
         vop.approved = approved;
         vop.token_id = token.token_id;
         push_applied_operation( vop );
      }

      void database::set_approval_for_all( const address& collection, const address& owner,
                                           const address& operator_, bool approved ) {
         const auto& idx = get_index_type<collection_operator_index>().indices().get<by_collection_owner_operator>();
         auto itr = idx.find( boost::make_tuple( collection, owner, operator_ ) );
         if( approved && itr == idx.end() ) {
            create<collection_operator_object>( [&]( collection_operator_object& obj ) {
               obj.collection = collection;
               obj.owner = owner;
               obj.operator_ = operator_;
            });
         } else if( !approved && itr != idx.end() ) {
            remove( *itr );
         }

         approval_for_all_operation vop;
         vop.collection = collection;
         vop.owner = owner;
         vop.operator_ = operator_;
         vop.approved = approved;
         push_applied_operation( vop );
      }
   }
} // nftcore::chain
