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
#include <curio/chain/account_object.hpp>
#include <curio/chain/collectible_object.hpp>
#include <curio/chain/distribution_config.hpp>
#include <curio/chain/evaluator.hpp>
#include <curio/chain/token_issuer.hpp>

#include <curio/db/object_database.hpp>

#include <fc/signals.hpp>

#include <functional>
#include <memory>

namespace curio { namespace chain {
   using curio::db::object_database;

   /**
    *   @class database
    *   @brief tracks accounts, balances, collectibles and royalty schedules and applies operations to them
    *
    *   Every operation is applied inside its own undo session. If any step of the
    *   operation throws, all changes made by that operation are undone.
    */
   class database : public object_database
   {
      public:
         explicit database( const distribution_config& config,
                            std::shared_ptr<token_issuer> issuer = std::make_shared<ledger_token_issuer>() );
         ~database();

         /**
          * @brief Open a database, creating the genesis state if it is empty
          * @param data_dir Path to open or create the database in
          * @param genesis_loader A callable returning the genesis state, called only for an empty database
          */
         void open( const fc::path& data_dir, std::function<genesis_state_type()> genesis_loader );

         /// Save all objects and release the database
         void close();

         void init_genesis( const genesis_state_type& genesis_state );

         /**
          * @brief Validate, evaluate and apply one operation atomically
          * @return The result of the evaluator
          *
          * The events queued while applying the operation are delivered through
          * @ref applied_events only after the operation has been applied completely.
          */
         operation_result apply_operation( const operation& op );

         /**
          *  Emitted once for every completion event of a successfully applied operation
          */
         fc::signal<void(const mint_event&)> applied_events;

         /// Queue an event of the operation being applied
         void push_applied_event( const mint_event& e );

         const distribution_config& get_config()const { return _config; }
         token_issuer& get_token_issuer()const { return *_issuer; }

         template<typename EvaluatorType>
         void register_evaluator()
         {
            _operation_evaluators[
               operation::tag<typename EvaluatorType::operation_type>::value].reset( new op_evaluator_impl<EvaluatorType>() );
         }

         //////////////////// db_balance.cpp ////////////////////

         /**
          * @brief Retrieve a particular account's balance
          * @param owner Account whose balance should be retrieved
          * @return owner's balance, zero if the account has never held funds
          */
         share_type get_balance( account_id_type owner )const;

         /**
          * @brief Adjust a particular account's balance
          * @param account ID of account whose balance should be adjusted
          * @param delta Signed amount to add to the balance
          *
          * @throws unknown_account if the account does not exist
          * @throws insufficient_balance if the balance would become negative
          */
         void adjust_balance( account_id_type account, share_type delta );

         /**
          * @brief Move funds between two accounts, debiting first
          */
         void transfer( account_id_type from, account_id_type to, share_type amount );

         const account_object& create_account( const string& name, share_type initial_balance = 0 );
         const account_object& get_account( const string& name )const;
         const account_object* find_account( const string& name )const;

         //////////////////// db_getter.cpp ////////////////////

         const collectible_object& get_collectible( collectible_id_type id )const;

         const royalty_schedule_object* find_royalty_schedule( collectible_id_type collectible )const;
         const royalty_schedule_object& get_royalty_schedule( collectible_id_type collectible )const;

         const collectible_holding_object* find_holding( account_id_type owner, collectible_id_type collectible )const;

         /// Units of @p collectible held by @p owner
         share_type get_holding( account_id_type owner, collectible_id_type collectible )const;

      private:
         void clear_pending_events();
         void initialize_indexes();
         void initialize_evaluators();

         const distribution_config                _config;
         std::shared_ptr<token_issuer>            _issuer;
         vector< std::unique_ptr<op_evaluator> >  _operation_evaluators;
         vector< mint_event >                     _pending_events;
   };

} } // curio::chain
