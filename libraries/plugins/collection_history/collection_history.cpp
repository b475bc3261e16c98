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
#include <nftcore/collection_history/collection_history.hpp>

#include <fc/log/logger.hpp>

namespace nftcore {
   namespace collection_history {

      namespace detail {

         class collection_history_impl {
         public:
            explicit collection_history_impl(collection_history &_plugin);

            virtual ~collection_history_impl();

            void on_applied_operation(const operation &op);

            void record_issuance(const token_issued_operation &op);

            chain::database &database() const {
               return _self.database();
            }

            friend class nftcore::collection_history::collection_history;

         private:
            collection_history &_self;

            /// Collections to track; every collection when empty
            flat_set<address> _tracked_collections;

            /// Oldest records are dropped beyond this count; unlimited when zero
            uint32_t _max_records = 0;

            collection_issuance_index _issuances;

            boost::signals2::scoped_connection _applied_operation_connection;
         };

         struct operation_process_collection_related {
            collection_history_impl &_impl;

            explicit operation_process_collection_related( collection_history_impl& history_impl )
               :_impl(history_impl) {

            }

            typedef void result_type;

            /** do nothing for other operation types */
            template<typename T>
            void operator()( const T& )const{}

            void operator()( const token_issued_operation& op ) const {
               _impl.record_issuance(op);
            }
         };

         void collection_history_impl::on_applied_operation(const operation &op) {
            op.visit( operation_process_collection_related( *this ) );
         }

         void collection_history_impl::record_issuance(const token_issued_operation &op) {
            if( !_tracked_collections.empty() && _tracked_collections.find(op.collection) == _tracked_collections.end() )
               return;

            const fc::time_point_sec now = database().head_block_time();
            _issuances.create( [&op, now]( collection_issuance_object& r ) {
               r.timestamp = now;
               r.collection = op.collection;
               r.item_id = op.item_id;
               r.issued_id = op.issued_id;
               r.token_id = op.token_id;
               r.beneficiary = op.beneficiary;
               r.minter = op.caller;
            });

            // Prune the oldest records
            while( _max_records > 0 && _issuances.size() > _max_records ) {
               const auto& oldest = *_issuances.indices().begin();
               dlog("collection_history: pruning issuance record ${id}", ("id", oldest.id));
               _issuances.remove(oldest);
            }
         }

         collection_history_impl::collection_history_impl(collection_history &_plugin) :
            _self(_plugin) {
         }

         collection_history_impl::~collection_history_impl() {
         }

      } // end namespace detail

      collection_history::collection_history(chain::database &db) :
         plugin(db),
         my(std::make_unique<detail::collection_history_impl>(*this)) {
      }

      collection_history::~collection_history() {
         cleanup();
      }

      std::string collection_history::plugin_name() const {
         return "collection_history";
      }

      std::string collection_history::plugin_description() const {
         return "Records the issuance history of collections";
      }

      void collection_history::plugin_set_program_options(
         boost::program_options::options_description &cli,
         boost::program_options::options_description &cfg
      ) {
         cli.add_options()
            ("collection-history-track-collection", boost::program_options::value<std::vector<std::string>>()->composing()->multitoken(),
             "Collection address to track the issuance history of (may specify multiple times; tracks all collections if omitted)")
            ("collection-history-max-records", boost::program_options::value<uint32_t>()->default_value(0),
             "Maximum number of issuance records to keep, oldest first out (0 keeps all)");
         cfg.add(cli);
      }

      void collection_history::plugin_initialize(const boost::program_options::variables_map &options) {
         my->_applied_operation_connection = database().applied_operation.connect([this](const operation &op) {
            my->on_applied_operation(op);
         });

         if (options.count("collection-history-track-collection") > 0) {
            for (const std::string &a : options["collection-history-track-collection"].as<std::vector<std::string>>())
               my->_tracked_collections.insert(address(a));
         }
         if (options.count("collection-history-max-records") > 0) {
            my->_max_records = options["collection-history-max-records"].as<uint32_t>();
         }

         ilog("collection_history: tracking ${n} collection(s), keeping at most ${max} records (0 = unlimited)",
              ("n", my->_tracked_collections.size())("max", my->_max_records));
      }

      void collection_history::plugin_startup() {
         ilog("collection_history: plugin_startup() begin");
      }

      void collection_history::plugin_shutdown() {
         ilog("collection_history: plugin_shutdown() begin");
         cleanup();
      }

      void collection_history::cleanup() {
         my->_applied_operation_connection.disconnect();
      }

      vector<collection_issuance_object> collection_history::get_issuances_by_collection(
         const address &collection,
         const fc::time_point_sec start,
         const fc::time_point_sec end) const {
         const auto &time_idx = my->_issuances.indices().get<by_issuance_timestamp>();

         vector<collection_issuance_object> result;
         auto itr = time_idx.lower_bound(boost::make_tuple(collection, start));
         while (itr != time_idx.end() && itr->collection == collection && itr->timestamp < end) {
            result.push_back(*itr);
            ++itr;
         }
         return result;
      }

      vector<collection_issuance_object> collection_history::get_issuances_by_item(const address &collection,
                                                                                  uint64_t item_id) const {
         const auto &item_idx = my->_issuances.indices().get<by_issuance_item>();

         vector<collection_issuance_object> result;
         auto range = item_idx.equal_range(boost::make_tuple(collection, item_id));
         for (auto itr = range.first; itr != range.second; ++itr)
            result.push_back(*itr);
         return result;
      }

      size_t collection_history::get_issuance_count(const address &collection, uint64_t item_id) const {
         const auto &item_idx = my->_issuances.indices().get<by_issuance_item>();
         auto range = item_idx.equal_range(boost::make_tuple(collection, item_id));
         return static_cast<size_t>(std::distance(range.first, range.second));
      }

      size_t collection_history::get_record_count() const {
         return my->_issuances.size();
      }

   }
}
