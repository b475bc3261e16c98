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

namespace nftcore {
   namespace chain {
      const proxy_factory_object* database::find_proxy_factory( const address& factory )const {
         const auto& idx = get_index_type<proxy_factory_index>().indices().get<by_factory>();
         auto itr = idx.find( factory );
         return itr == idx.end() ? nullptr : &*itr;
      }

      const proxy_factory_object& database::get_proxy_factory( const address& factory )const {
         const proxy_factory_object* obj = find_proxy_factory( factory );
         NFTCORE_ASSERT( obj != nullptr, unknown_contract_exception,
                         "No proxy factory is deployed at ${a}", ("a", factory) );
         return *obj;
      }

      address database::compute_collection_address( const address& factory, const salt_type& salt,
                                                    const address& deployer )const {
         const proxy_factory_object& f = get_proxy_factory( factory );
         return compute_create2_address( factory, derive_creation_proof( salt, deployer ), f.code_hash );
      }

      bool database::is_valid_collection( const address& factory, const address& candidate )const {
         const proxy_factory_object& f = get_proxy_factory( factory );
         const collection_object* c = find_collection( candidate );
         if( c == nullptr )
            return false;
         return compute_create2_address( factory, c->proof_of_creation, f.code_hash ) == candidate;
      }

      const collection_manager_object& database::get_collection_manager( const address& manager )const {
         const auto& idx = get_index_type<collection_manager_index>().indices().get<by_manager>();
         auto itr = idx.find( manager );
         NFTCORE_ASSERT( itr != idx.end(), unknown_contract_exception,
                         "No collection manager is deployed at ${a}", ("a", manager) );
         return *itr;
      }

      const forwarder_object& database::get_forwarder( const address& forwarder )const {
         const auto& idx = get_index_type<forwarder_index>().indices().get<by_forwarder>();
         auto itr = idx.find( forwarder );
         NFTCORE_ASSERT( itr != idx.end(), unknown_contract_exception,
                         "No forwarder is deployed at ${a}", ("a", forwarder) );
         return *itr;
      }

      const fungible_token_object& database::get_fungible_token( const address& token )const {
         const auto& idx = get_index_type<fungible_token_index>().indices().get<by_token>();
         auto itr = idx.find( token );
         NFTCORE_ASSERT( itr != idx.end(), unknown_contract_exception,
                         "No fungible token is deployed at ${a}", ("a", token) );
         return *itr;
      }

      uint256_t database::get_fungible_balance( const address& token, const address& holder )const {
         return get_fungible_token( token ).balance_of( holder );
      }

      uint256_t database::get_fungible_allowance( const address& token, const address& holder,
                                                  const address& spender )const {
         return get_fungible_token( token ).allowance_of( holder, spender );
      }

      void database::fungible_transfer( const fungible_token_object& token, const address& from,
                                        const address& to, const uint256_t& amount ) {
         NFTCORE_ASSERT( !to.is_zero(), invalid_address_exception,
                         "ERC20: transfer to the zero address", ("token", token.token) );
         const uint256_t balance = token.balance_of( from );
         NFTCORE_ASSERT( balance >= amount, insufficient_balance_exception,
                         "ERC20: transfer amount exceeds balance",
                         ("from", from)("balance", balance)("amount", amount) );

         modify( token, [&]( fungible_token_object& obj ) {
            obj.balances[from] -= amount;
            obj.balances[to] += amount;
         });

         fungible_transferred_operation vop;
         vop.token = token.token;
         vop.from = from;
         vop.to = to;
         vop.amount = amount;
         push_applied_operation( vop );
      }

      void database::fungible_transfer_from( const fungible_token_object& token, const address& spender,
                                             const address& from, const address& to, const uint256_t& amount ) {
         const uint256_t allowance = token.allowance_of( from, spender );
         NFTCORE_ASSERT( allowance >= amount, insufficient_allowance_exception,
                         "ERC20: transfer amount exceeds allowance",
                         ("from", from)("spender", spender)("allowance", allowance)("amount", amount) );

         fungible_transfer( token, from, to, amount );
         modify( token, [&]( fungible_token_object& obj ) {
            obj.allowances[std::make_pair( from, spender )] -= amount;
         });
      }
   }
} // nftcore::chain
