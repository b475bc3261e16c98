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
#include <nftcore/protocol/collection.hpp>
#include <nftcore/protocol/exceptions.hpp>

namespace nftcore {
   namespace protocol {
      namespace {
         void validate_caller( const address& caller ) {
            NFTCORE_ASSERT( !caller.is_zero(), invalid_address_exception,
                            "The caller may not be the zero address", ("caller", caller) );
         }

         template<typename A, typename B>
         void validate_lengths( const vector<A>& a, const vector<B>& b ) {
            NFTCORE_ASSERT( a.size() == b.size(), length_mismatch_exception,
                            "Argument lengths differ (${a} != ${b}) (LENGTH_MISMATCH)",
                            ("a", a.size())("b", b.size()) );
         }

         void validate_sales_data( const uint256_t& price, const address& beneficiary ) {
            NFTCORE_ASSERT( ( price == 0 ) == beneficiary.is_zero(), invalid_price_and_beneficiary_exception,
                            "A price requires a beneficiary and a beneficiary requires a price (INVALID_PRICE_AND_BENEFICIARY)",
                            ("price", price)("beneficiary", beneficiary) );
         }
      }

      void collection_item::validate()const {
         NFTCORE_ASSERT( is_valid_rarity( rarity ), invalid_rarity_exception,
                         "Unknown rarity ${r}", ("r", rarity) );
         NFTCORE_ASSERT( total_supply == 0, invalid_item_supply_exception,
                         "A new item should not have a supply (${s})", ("s", total_supply) );
         validate_sales_data( price, beneficiary );
         NFTCORE_ASSERT( !metadata.empty(), empty_metadata_exception,
                         "Item metadata should not be empty (EMPTY_METADATA)", ("item", *this) );
         NFTCORE_ASSERT( content_hash == content_hash_type(), invalid_content_hash_exception,
                         "A new item should not carry a content hash", ("hash", content_hash) );
      }

      void minter_allowance::consume() {
         if( is_unlimited() )
            return;
         FC_ASSERT( remaining > 0, "The minter allowance is already spent" );
         --remaining;
      }

      void collection_init_data::validate()const {
         NFTCORE_ASSERT( !creator.is_zero(), invalid_creator_address_exception,
                         "The creator may not be the zero address (INVALID_CREATOR_ADDRESS)", ("creator", creator) );
         for( const collection_item& item : items )
            item.validate();
      }

      void collection_deploy_operation::validate()const {
         validate_caller( caller );
      }

      void collection_initialize_operation::validate()const {
         validate_caller( caller );
         data.validate();
      }

      void collection_add_items_operation::validate()const {
         validate_caller( caller );
         for( const collection_item& item : items )
            item.validate();
      }

      void collection_edit_items_sales_data_operation::validate()const {
         validate_caller( caller );
         validate_lengths( item_ids, prices );
         validate_lengths( item_ids, beneficiaries );
         for( size_t i = 0; i < item_ids.size(); ++i )
            validate_sales_data( prices[i], beneficiaries[i] );
      }

      void collection_edit_items_metadata_operation::validate()const {
         validate_caller( caller );
         validate_lengths( item_ids, metadatas );
         for( const string& metadata : metadatas )
            NFTCORE_ASSERT( !metadata.empty(), empty_metadata_exception,
                            "Item metadata should not be empty (EMPTY_METADATA)", ("item_ids", item_ids) );
      }

      void collection_rescue_items_operation::validate()const {
         validate_caller( caller );
         validate_lengths( item_ids, content_hashes );
         validate_lengths( item_ids, metadatas );
      }

      void collection_set_approved_operation::validate()const {
         validate_caller( caller );
      }

      void collection_set_editable_operation::validate()const {
         validate_caller( caller );
      }

      void collection_set_base_uri_operation::validate()const {
         validate_caller( caller );
      }

      void collection_complete_operation::validate()const {
         validate_caller( caller );
      }

      void collection_transfer_creatorship_operation::validate()const {
         validate_caller( caller );
      }

      void collection_set_minters_operation::validate()const {
         validate_caller( caller );
         validate_lengths( minters, values );
         for( const address& minter : minters )
            NFTCORE_ASSERT( !minter.is_zero(), invalid_minter_address_exception,
                            "A minter may not be the zero address (INVALID_MINTER_ADDRESS)", ("minters", minters) );
      }

      void collection_set_managers_operation::validate()const {
         validate_caller( caller );
         validate_lengths( managers, values );
         for( const address& manager : managers )
            NFTCORE_ASSERT( !manager.is_zero(), invalid_manager_address_exception,
                            "A manager may not be the zero address (INVALID_MANAGER_ADDRESS)", ("managers", managers) );
      }

      void collection_set_items_minters_operation::validate()const {
         validate_caller( caller );
         validate_lengths( item_ids, minters );
         validate_lengths( item_ids, values );
         for( const address& minter : minters )
            NFTCORE_ASSERT( !minter.is_zero(), invalid_minter_address_exception,
                            "A minter may not be the zero address (INVALID_MINTER_ADDRESS)", ("minters", minters) );
      }

      void collection_set_items_managers_operation::validate()const {
         validate_caller( caller );
         validate_lengths( item_ids, managers );
         validate_lengths( item_ids, values );
         for( const address& manager : managers )
            NFTCORE_ASSERT( !manager.is_zero(), invalid_manager_address_exception,
                            "A manager may not be the zero address (INVALID_MANAGER_ADDRESS)", ("managers", managers) );
      }

      void collection_issue_token_operation::validate()const {
         validate_caller( caller );
      }

      void collection_issue_tokens_operation::validate()const {
         validate_caller( caller );
         validate_lengths( beneficiaries, item_ids );
      }

      void contract_transfer_ownership_operation::validate()const {
         validate_caller( caller );
         NFTCORE_ASSERT( !new_owner.is_zero(), invalid_address_exception,
                         "Ownable: new owner is the zero address", ("new_owner", new_owner) );
      }
   }
} // nftcore::protocol
