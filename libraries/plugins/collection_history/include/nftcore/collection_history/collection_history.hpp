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

#include <nftcore/app/plugin.hpp>
#include <nftcore/chain/database.hpp>
#include <nftcore/db/generic_index.hpp>

#include <boost/multi_index/composite_key.hpp>

namespace nftcore { namespace collection_history {
using namespace chain;

/**
 * @brief One token issuance observed by the plugin
 */
struct collection_issuance_object : public nftcore::db::object
{
   fc::time_point_sec timestamp;
   address collection;
   uint64_t item_id = 0;
   uint256_t issued_id;
   token_id_type token_id;
   address beneficiary;

   /// Address that requested the issuance
   address minter;
};

struct by_issuance_timestamp;
struct by_issuance_item;
typedef multi_index_container<
   collection_issuance_object,
   indexed_by<
      ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > >,
      ordered_unique< tag<by_issuance_timestamp>,
         composite_key< collection_issuance_object,
            member< collection_issuance_object, address, &collection_issuance_object::collection >,
            member< collection_issuance_object, fc::time_point_sec, &collection_issuance_object::timestamp >,
            member< object, object_id_type, &object::id >
         >
      >,
      ordered_unique< tag<by_issuance_item>,
         composite_key< collection_issuance_object,
            member< collection_issuance_object, address, &collection_issuance_object::collection >,
            member< collection_issuance_object, uint64_t, &collection_issuance_object::item_id >,
            member< object, object_id_type, &object::id >
         >
      >
   >
> collection_issuance_multi_index_type;
typedef nftcore::db::generic_index<collection_issuance_object, collection_issuance_multi_index_type> collection_issuance_index;

namespace detail
{
    class collection_history_impl;
}

class collection_history : public nftcore::app::plugin
{
   public:
      explicit collection_history(chain::database& db);
      ~collection_history() override;

      std::string plugin_name()const override;
      std::string plugin_description()const override;
      void plugin_set_program_options(
         boost::program_options::options_description& cli,
         boost::program_options::options_description& cfg) override;
      void plugin_initialize(const boost::program_options::variables_map& options) override;
      void plugin_startup() override;
      void plugin_shutdown() override;

      /**
       * @brief Get the issuances of a collection
       * @param collection Collection address
       * @param start Start time (inclusive)
       * @param end End time (exclusive)
       * @return Issuances in the order they were observed
       */
      vector<collection_issuance_object> get_issuances_by_collection(const address& collection,
                                                                    const fc::time_point_sec start,
                                                                    const fc::time_point_sec end) const;

      /**
       * @brief Get the issuances of one item
       * @param collection Collection address
       * @param item_id Item identifier
       * @return Issuances in the order they were observed
       */
      vector<collection_issuance_object> get_issuances_by_item(const address& collection, uint64_t item_id) const;

      /// Number of retained issuance records of one item
      size_t get_issuance_count(const address& collection, uint64_t item_id) const;

      /// Number of issuance records currently retained
      size_t get_record_count() const;

   private:
      void cleanup();

      std::unique_ptr<detail::collection_history_impl> my;
};

} } // nftcore::collection_history

FC_REFLECT_DERIVED( nftcore::collection_history::collection_issuance_object, (nftcore::db::object),
                    (timestamp)(collection)(item_id)(issued_id)(token_id)(beneficiary)(minter) )
