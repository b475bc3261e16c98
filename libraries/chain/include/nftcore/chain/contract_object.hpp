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

namespace nftcore {
   namespace chain {
      using namespace nftcore::db;

      /// What a deployed address runs
      enum contract_kind {
         collection_contract = 0,
         proxy_factory_contract = 1,
         collection_manager_contract = 2,
         forwarder_contract = 3,
         fungible_token_contract = 4
      };

      /**
       *  @brief Registry entry of a deployed contract
       *  @ingroup object
       *
       *  Every address the database knows as a contract has exactly one of these.  It carries the
       *  ownership shared by all contract kinds.
       */
      class contract_object : public object {
      public:
         static constexpr uint8_t type_id = contract_object_type;

         address contract;
         contract_kind kind = collection_contract;

         /// Zero until the contract is claimed (an uninitialized collection has no owner)
         address owner;

         /// Address that deployed the contract
         address deployer;

         fc::time_point_sec created;
      };

      struct by_address;
      typedef multi_index_container<
         contract_object,
         indexed_by<
            ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > >,
            ordered_unique< tag<by_address>, member< contract_object, address, &contract_object::contract > >
         >
      > contract_multi_index_type;
      typedef generic_index<contract_object, contract_multi_index_type> contract_index;
   }
} // nftcore::chain

FC_REFLECT_ENUM( nftcore::chain::contract_kind,
                 (collection_contract)(proxy_factory_contract)(collection_manager_contract)
                 (forwarder_contract)(fungible_token_contract) )

FC_REFLECT_DERIVED( nftcore::chain::contract_object, (nftcore::db::object),
                    (contract)(kind)(owner)(deployer)(created) )
