/**
 *  Shared fixture for the handlepay suites. Boots eosio.token (TLOS) and a second token contract (TKN),
 *  the mock registry and the three handlepay contracts, and wires the eosio.code permissions the inline
 *  transfers need.
 *
 *  @copyright defined in handlepay/LICENSE.txt
 */
#pragma once
#include <boost/test/unit_test.hpp>
#include <eosio/testing/tester.hpp>
#include <eosio/chain/abi_serializer.hpp>
#include <eosio/chain/contract_table_objects.hpp>

#include <eosio.token/eosio.token.wast.hpp>
#include <eosio.token/eosio.token.abi.hpp>

#include <contracts.hpp>

#include <fc/crypto/sha256.hpp>
#include <fc/variant_object.hpp>

#include <algorithm>

#ifdef NON_VALIDATING_TEST
#define TESTER tester
#else
#define TESTER validating_tester
#endif

using namespace eosio;
using namespace eosio::chain;
using namespace eosio::testing;
using namespace fc;
using namespace std;

using mvo = fc::mutable_variant_object;

// row layout of handlevault::vault_balance
struct vault_row {
   uint64_t     id;
   fc::sha256   handle_hash;
   account_name contract;
   asset        balance;
};

FC_REFLECT(vault_row, (id)(handle_hash)(contract)(balance))

class handlepay_tester : public TESTER {
public:

   const symbol tlos = symbol::from_string("4,TLOS");
   const symbol tkn  = symbol::from_string("0,TKN");

   handlepay_tester() {
      produce_blocks( 2 );

      create_accounts( { N(eosio.token), N(tkn.token), N(registry), N(handlepay), N(handlevault), N(feesplitter),
                         N(sender), N(alice), N(bob), N(carol), N(treasury), N(stake.one), N(stake.two), N(spladmin) } );
      produce_blocks( 2 );

      set_code_abi( N(eosio.token), eosio_token_wast, eosio_token_abi, token_abi );
      set_code_abi( N(tkn.token), eosio_token_wast, eosio_token_abi, token_abi );
      set_code_abi( N(registry), contracts::mock_registry_wast().c_str(), contracts::mock_registry_abi().data(), registry_abi );
      set_code_abi( N(handlepay), contracts::handle_pay_wast().c_str(), contracts::handle_pay_abi().data(), pay_abi );
      set_code_abi( N(handlevault), contracts::handle_vault_wast().c_str(), contracts::handle_vault_abi().data(), vault_abi );
      set_code_abi( N(feesplitter), contracts::fee_splitter_wast().c_str(), contracts::fee_splitter_abi().data(), splitter_abi );

      // contracts send transfers as themselves, the dispatcher is also pulled from by the vault
      grant_code( N(handlepay),   { N(handlepay), N(handlevault) } );
      grant_code( N(handlevault), { N(handlevault) } );
      grant_code( N(feesplitter), { N(feesplitter) } );
      grant_code( N(sender),      { N(handlepay), N(handlevault) } );

      create_currency( N(eosio.token), asset::from_string("1000000000.0000 TLOS") );
      create_currency( N(tkn.token), asset::from_string("1000000000 TKN") );
      issue( N(eosio.token), N(sender), asset::from_string("1000.0000 TLOS") );
      issue( N(tkn.token), N(sender), asset::from_string("1000 TKN") );

      BOOST_REQUIRE_EQUAL( success(), send_action( N(handlepay), N(handlepay), N(setregistry), mvo()("registry", "registry") ) );
      BOOST_REQUIRE_EQUAL( success(), send_action( N(handlevault), N(handlevault), N(setregistry), mvo()("registry", "registry") ) );
      produce_blocks();
   }

   void set_code_abi( account_name account, const char* wast, const char* abi, abi_serializer& ser ) {
      set_code( account, wast );
      set_abi( account, abi );
      produce_blocks();

      const auto& accnt = control->db().get<account_object,by_name>( account );
      abi_def abi_definition;
      BOOST_REQUIRE_EQUAL( abi_serializer::to_abi(accnt.abi, abi_definition), true );
      ser.set_abi( abi_definition, abi_serializer_max_time );
   }

   // adds <code>@eosio.code for every account in codes to account@active
   void grant_code( account_name account, vector<account_name> codes ) {
      std::sort( codes.begin(), codes.end() );

      auto auth = authority( get_public_key( account, "active" ) );
      for( const auto& c : codes ) {
         auth.accounts.push_back( permission_level_weight{ { c, config::eosio_code_name }, 1 } );
      }

      set_authority( account, config::active_name, auth, config::owner_name );
   }

   abi_serializer& serializer_for( account_name contract ) {
      if( contract == N(handlepay) )   return pay_abi;
      if( contract == N(handlevault) ) return vault_abi;
      if( contract == N(feesplitter) ) return splitter_abi;
      if( contract == N(registry) )    return registry_abi;
      return token_abi;
   }

   action_result send_action( account_name contract, account_name signer, action_name name, const variant_object& data ) {
      auto& ser = serializer_for( contract );
      string action_type_name = ser.get_action_type( name );

      action act;
      act.account = contract;
      act.name    = name;
      act.data    = ser.variant_to_binary( action_type_name, data, abi_serializer_max_time );

      return base_tester::push_action( std::move(act), uint64_t(signer) );
   }

   void create_currency( account_name contract, asset max_supply ) {
      BOOST_REQUIRE_EQUAL( success(), send_action( contract, contract, N(create), mvo()
         ("issuer", contract)
         ("maximum_supply", max_supply)
      ) );
   }

   void issue( account_name contract, account_name to, asset quantity ) {
      BOOST_REQUIRE_EQUAL( success(), send_action( contract, contract, N(issue), mvo()
         ("to", contract)
         ("quantity", quantity)
         ("memo", "")
      ) );
      BOOST_REQUIRE_EQUAL( success(), transfer( contract, contract, to, quantity, "" ) );
   }

   action_result transfer( account_name contract, account_name from, account_name to, asset quantity, const string& memo ) {
      return send_action( contract, from, N(transfer), mvo()
         ("from", from)
         ("to", to)
         ("quantity", quantity)
         ("memo", memo)
      );
   }

   action_result register_handle( const string& handle, account_name owner ) {
      return send_action( N(registry), N(registry), N(setowner), mvo()
         ("handle", handle)
         ("owner", owner)
      );
   }

   fc::variant token_ref( account_name contract, const symbol& sym ) {
      return mvo()
         ("contract", contract)
         ("sym_code", sym.to_symbol_code().value);
   }

   asset tlos_balance( account_name owner ) {
      return get_currency_balance( N(eosio.token), tlos, owner );
   }

   asset tkn_balance( account_name owner ) {
      return get_currency_balance( N(tkn.token), tkn, owner );
   }

   asset get_fee_pool( account_name component, account_name token_contract, const symbol& sym ) {
      vector<char> data = get_row_by_account( component, token_contract, N(feepools), account_name(sym.to_symbol_code().value) );
      return data.empty() ? asset( 0, sym ) : fc::raw::unpack<asset>( data );
   }

   const key_value_object* find_vault_row( const string& handle, account_name token_contract, const symbol& sym ) {
      auto hash = fc::sha256::hash( handle );
      const auto& db = control->db();
      const auto* tbl = db.find<table_id_object, by_code_scope_table>( boost::make_tuple( N(handlevault), scope_name(hash._hash[0]), N(balances) ) );

      if( tbl ) {
         const auto& idx = db.get_index<key_value_index, by_scope_primary>();
         for( auto itr = idx.lower_bound( boost::make_tuple( tbl->id ) ); itr != idx.end() && itr->t_id == tbl->id; ++itr ) {
            vault_row row;
            fc::datastream<const char*> ds( itr->value.data(), itr->value.size() );
            fc::raw::unpack( ds, row );

            if( row.handle_hash == hash && row.contract == token_contract && row.balance.get_symbol() == sym ) {
               return &*itr;
            }
         }
      }

      return nullptr;
   }

   asset get_vault_balance( const string& handle, account_name token_contract, const symbol& sym ) {
      const auto* obj = find_vault_row( handle, token_contract, sym );
      if( !obj ) {
         return asset( 0, sym );
      }

      vault_row row;
      fc::datastream<const char*> ds( obj->value.data(), obj->value.size() );
      fc::raw::unpack( ds, row );
      return row.balance;
   }

   // account billed for the escrow row, 0 when there is no row
   account_name vault_row_payer( const string& handle, account_name token_contract, const symbol& sym ) {
      const auto* obj = find_vault_row( handle, token_contract, sym );
      return obj ? obj->payer : account_name();
   }

   account_name fee_pool_payer( account_name component, account_name token_contract, const symbol& sym ) {
      const auto& db = control->db();
      const auto* tbl = db.find<table_id_object, by_code_scope_table>( boost::make_tuple( component, scope_name(token_contract), N(feepools) ) );
      if( !tbl ) {
         return account_name();
      }

      const auto* obj = db.find<key_value_object, by_scope_primary>( boost::make_tuple( tbl->id, sym.to_symbol_code().value ) );
      return obj ? obj->payer : account_name();
   }

   bool call_locked( account_name component ) {
      vector<char> data = get_row_by_account( component, component, N(calllock), N(calllock) );
      return data.empty() ? false : fc::raw::unpack<bool>( data );
   }

   fc::variant get_config( account_name component ) {
      vector<char> data = get_row_by_account( component, component, N(config), N(config) );
      return data.empty() ? fc::variant() : serializer_for( component ).binary_to_variant( "config", data, abi_serializer_max_time );
   }

   abi_serializer token_abi;
   abi_serializer registry_abi;
   abi_serializer pay_abi;
   abi_serializer vault_abi;
   abi_serializer splitter_abi;
};
