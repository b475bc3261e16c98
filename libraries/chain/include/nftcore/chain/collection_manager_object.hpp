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
#include <nftcore/chain/types.hpp>
#include <nftcore/db/generic_index.hpp>

#include <map>

namespace nftcore {
   namespace chain {
      using namespace nftcore::db;

      /**
       *  @brief Tracks the settings of a collection manager
       *  @ingroup object
       */
      class collection_manager_object : public object {
      public:
         static constexpr uint8_t type_id = collection_manager_object_type;

         address manager;

         /// Fungible token in which creation fees are paid
         address accepted_token;

         /// Only address allowed to manage collections through the manager
         address committee;

         /// Receiver of creation fees
         address fees_collector;

         /// Fee charged for every item of a created collection
         uint256_t price_per_item;
      };

      struct by_manager;
      typedef multi_index_container<
         collection_manager_object,
         indexed_by<
            ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > >,
            ordered_unique< tag<by_manager>, member< collection_manager_object, address, &collection_manager_object::manager > >
         >
      > collection_manager_multi_index_type;
      typedef generic_index<collection_manager_object, collection_manager_multi_index_type> collection_manager_index;

      /**
       *  @brief Tracks a forwarder
       *  @ingroup object
       */
      class forwarder_object : public object {
      public:
         static constexpr uint8_t type_id = forwarder_object_type;

         address forwarder;

         /// Besides the owner, the only address allowed to relay calls
         address forward_caller;
      };

      struct by_forwarder;
      typedef multi_index_container<
         forwarder_object,
         indexed_by<
            ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > >,
            ordered_unique< tag<by_forwarder>, member< forwarder_object, address, &forwarder_object::forwarder > >
         >
      > forwarder_multi_index_type;
      typedef generic_index<forwarder_object, forwarder_multi_index_type> forwarder_index;

      /**
       *  @brief Balances and allowances of a minimal fungible token
       *  @ingroup object
       */
      class fungible_token_object : public object {
      public:
         static constexpr uint8_t type_id = fungible_token_object_type;

         address token;
         string symbol;
         uint256_t total_supply;

         std::map<address, uint256_t> balances;

         /// (holder, spender) -> amount
         std::map<std::pair<address, address>, uint256_t> allowances;

         uint256_t balance_of( const address& holder )const {
            auto itr = balances.find( holder );
            return itr == balances.end() ? uint256_t() : itr->second;
         }

         uint256_t allowance_of( const address& holder, const address& spender )const {
            auto itr = allowances.find( std::make_pair( holder, spender ) );
            return itr == allowances.end() ? uint256_t() : itr->second;
         }
      };

      struct by_token;
      typedef multi_index_container<
         fungible_token_object,
         indexed_by<
            ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > >,
            ordered_unique< tag<by_token>, member< fungible_token_object, address, &fungible_token_object::token > >
         >
      > fungible_token_multi_index_type;
      typedef generic_index<fungible_token_object, fungible_token_multi_index_type> fungible_token_index;
   }
} // nftcore::chain

FC_REFLECT_DERIVED( nftcore::chain::collection_manager_object, (nftcore::db::object),
                    (manager)(accepted_token)(committee)(fees_collector)(price_per_item) )
FC_REFLECT_DERIVED( nftcore::chain::forwarder_object, (nftcore::db::object),
                    (forwarder)(forward_caller) )
FC_REFLECT_DERIVED( nftcore::chain::fungible_token_object, (nftcore::db::object),
                    (token)(symbol)(total_supply)(balances)(allowances) )
