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
#include <curio/mint_history/mint_history.hpp>

#include <curio/chain/account_object.hpp>

#include <set>

namespace curio {
   namespace mint_history {

      namespace detail {

         class mint_history_impl {
         public:
            explicit mint_history_impl(mint_history &_plugin);

            virtual ~mint_history_impl();

            void on_event(const mint_event &e);

            curio::chain::database &database() const {
               return _self.database();
            }

            friend class curio::mint_history::mint_history;

            /// Whether payments to @p recipient should be recorded
            bool is_tracked(const account_id_type &recipient) const;

            void record_payment(const collectible_id_type &collectible, const account_id_type &payer,
                                const account_id_type &recipient, const share_type &amount,
                                royalty_payment_kind kind);

         private:
            mint_history &_self;

            /// Names of the accounts to record, all accounts when empty
            std::set<std::string> _tracked_accounts;
         };

         struct event_process_payments {
            mint_history_impl &_impl;

            explicit event_process_payments(mint_history_impl &history_impl)
               :_impl(history_impl) {
            }

            typedef void result_type;

            void operator()( const minted_event& e ) const {
               _impl.record_payment(e.collectible, e.payer, e.platform, e.fee, platform_fee_payment);
               _impl.record_payment(e.collectible, e.payer, e.creator, e.net, single_creator_payment);
            }

            void operator()( const collaborative_minted_event& e ) const {
               _impl.record_payment(e.collectible, e.buyer, e.platform, e.platform_fee, platform_fee_payment);
               for( const creator_payout& p : e.payouts )
                  _impl.record_payment(e.collectible, e.buyer, p.recipient, p.amount, creator_share_payment);
            }

            void operator()( const royalty_distributed_event& e ) const {
               _impl.record_payment(e.collectible, e.payer, e.platform, e.platform_fee, platform_fee_payment);
               for( const creator_payout& p : e.payouts )
                  _impl.record_payment(e.collectible, e.payer, p.recipient, p.amount, creator_share_payment);
            }
         };

         void mint_history_impl::on_event(const mint_event &e) {
            try {
               e.visit( event_process_payments( *this ) );
            } FC_CAPTURE_AND_LOG( (e) )
         }

         mint_history_impl::mint_history_impl(mint_history &_plugin) :
            _self(_plugin) {
         }

         mint_history_impl::~mint_history_impl() {
         }

         bool mint_history_impl::is_tracked(const account_id_type &recipient) const {
            if (_tracked_accounts.empty())
               return true;
            const account_object *account = database().find<account_object>(recipient);
            return account != nullptr && _tracked_accounts.count(account->name) > 0;
         }

         void mint_history_impl::record_payment(const collectible_id_type &collectible, const account_id_type &payer,
                                                const account_id_type &recipient, const share_type &amount,
                                                royalty_payment_kind kind) {
            if (amount == 0 || !is_tracked(recipient))
               return;

            database().create<royalty_payment_object>( [&]( royalty_payment_object& p ) {
               p.collectible = collectible;
               p.payer = payer;
               p.recipient = recipient;
               p.amount = amount;
               p.kind = kind;
            });
         }

      } // end namespace detail

      mint_history::mint_history() :
         my(std::make_unique<detail::mint_history_impl>(*this)) {
      }

      mint_history::~mint_history() {
         cleanup();
      }

      curio::chain::database& mint_history::database() const {
         FC_ASSERT(_db != nullptr, "The mint_history plugin has not been initialized");
         return *_db;
      }

      std::string mint_history::plugin_name() const {
         return "mint_history";
      }

      std::string mint_history::plugin_description() const {
         return "Records the platform fee and creator payments of every settled sale";
      }

      void mint_history::plugin_set_program_options(
         boost::program_options::options_description &cli,
         boost::program_options::options_description &cfg
      ) {
         cli.add_options()
            ("track-account", boost::program_options::value<std::vector<std::string>>()->composing(),
             "Name of an account whose received payments are recorded (may specify multiple times, all accounts by default)");
         cfg.add(cli);
      }

      void mint_history::plugin_initialize(curio::chain::database &db,
                                           const boost::program_options::variables_map &options) {
         _db = &db;
         _applied_events_connection = database().applied_events.connect([this](const mint_event &e) {
            my->on_event(e);
         });

         database().add_index< primary_index< royalty_payment_index > >();

         if (options.count("track-account") > 0) {
            const std::vector<std::string> names = options["track-account"].as<std::vector<std::string>>();
            my->_tracked_accounts.insert(names.begin(), names.end());
         }
      }

      void mint_history::plugin_startup() {
         ilog("mint_history: plugin_startup() begin");
      }

      void mint_history::plugin_shutdown() {
         ilog("mint_history: plugin_shutdown() begin");
         cleanup();
      }

      void mint_history::cleanup() {
         _applied_events_connection.disconnect();
      }

      share_type mint_history::get_total_received(const account_id_type recipient) const {
         const auto& payment_idx = database().get_index_type<royalty_payment_index>();
         const auto& by_recipient_idx = payment_idx.indices().get<by_payment_recipient>();

         share_type cumulative;
         auto itr = by_recipient_idx.lower_bound(boost::make_tuple(recipient, object_id_type()));
         while( itr != by_recipient_idx.end() && itr->recipient == recipient ) {
            cumulative += itr->amount;
            ++itr;
         }

         return cumulative;
      }

      share_type mint_history::get_total_received(const string recipient_name) const {
         return get_total_received(database().get_account(recipient_name).get_id());
      }

      vector<royalty_payment_object> mint_history::get_payments_to(const account_id_type recipient, uint32_t limit) const {
         const auto& payment_idx = database().get_index_type<royalty_payment_index>();
         const auto& by_recipient_idx = payment_idx.indices().get<by_payment_recipient>();

         vector<royalty_payment_object> payments;
         auto itr = by_recipient_idx.lower_bound(boost::make_tuple(recipient, object_id_type()));
         while( itr != by_recipient_idx.end() && itr->recipient == recipient && payments.size() < limit ) {
            payments.emplace_back(*itr);
            ++itr;
         }

         return payments;
      }

      vector<royalty_payment_object> mint_history::get_payments_by_collectible(const collectible_id_type collectible) const {
         const auto& payment_idx = database().get_index_type<royalty_payment_index>();
         const auto& by_collectible_idx = payment_idx.indices().get<by_payment_collectible>();

         vector<royalty_payment_object> payments;
         auto itr = by_collectible_idx.lower_bound(boost::make_tuple(collectible, object_id_type()));
         while( itr != by_collectible_idx.end() && itr->collectible == collectible ) {
            payments.emplace_back(*itr);
            ++itr;
         }

         return payments;
      }

   }
}
