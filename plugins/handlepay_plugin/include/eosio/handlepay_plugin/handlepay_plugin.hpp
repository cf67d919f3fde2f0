/**
 *  Read-only access to handlepay state for nodeos: handle key derivation, escrowed balances per handle and
 *  accumulated fee pools of the dispatcher and the vault.
 *
 *  @copyright defined in handlepay/LICENSE.txt
 */
#pragma once
#include <appbase/application.hpp>
#include <eosio/chain_plugin/chain_plugin.hpp>
#include <eosio/chain/controller.hpp>
#include <eosio/http_plugin/http_plugin.hpp>
#include <eosio/chain/exceptions.hpp>
#include <fc/crypto/sha256.hpp>
#include <fc/io/json.hpp>

namespace eosio {

using namespace appbase;
using std::shared_ptr;

typedef shared_ptr<class handlepay_plugin_impl> handlepay_ptr;

namespace handlepay_apis {
    class read_only {
        const chain::controller& db;
        const chain::account_name dispatcher;
        const chain::account_name vault;

    public:

        read_only(const chain::controller& db, chain::account_name dispatcher, chain::account_name vault)
                : db(db), dispatcher(dispatcher), vault(vault) {}

        struct get_handle_key_params {
            string handle;
        };

        struct get_handle_key_results {
            string handle;
            fc::sha256 hash;
            uint64_t scope;
        };

        get_handle_key_results get_handle_key( const get_handle_key_params& p )const;

        struct vault_entry {
            chain::account_name contract;
            chain::asset balance;
        };

        struct get_vault_balances_params {
            string handle;
        };

        struct get_vault_balances_results {
            string handle;
            vector<vault_entry> balances;
        };

        get_vault_balances_results get_vault_balances( const get_vault_balances_params& p )const;

        struct get_fee_pools_params {
            chain::account_name code;
            chain::account_name token_contract;
        };

        struct get_fee_pools_results {
            vector<chain::asset> pools;
        };

        get_fee_pools_results get_fee_pools( const get_fee_pools_params& p )const;

    private:

        template<typename Function>
        void walk_table( chain::account_name code, uint64_t scope, chain::name table, Function f )const;
    };

}

class handlepay_plugin : public appbase::plugin<handlepay_plugin> {

    public:

    APPBASE_PLUGIN_REQUIRES((http_plugin)(chain_plugin))

    handlepay_plugin();
    virtual ~handlepay_plugin();

    virtual void set_program_options(options_description&, options_description& cfg) override;

    void plugin_initialize(const variables_map& options);
    void plugin_startup();
    void plugin_shutdown();

    handlepay_apis::read_only get_read_only_api()const;

    private:
    handlepay_ptr my;
};

} //namespace eosio

FC_REFLECT(eosio::handlepay_apis::read_only::get_handle_key_params, (handle))
FC_REFLECT(eosio::handlepay_apis::read_only::get_handle_key_results, (handle)(hash)(scope))
FC_REFLECT(eosio::handlepay_apis::read_only::vault_entry, (contract)(balance))
FC_REFLECT(eosio::handlepay_apis::read_only::get_vault_balances_params, (handle))
FC_REFLECT(eosio::handlepay_apis::read_only::get_vault_balances_results, (handle)(balances))
FC_REFLECT(eosio::handlepay_apis::read_only::get_fee_pools_params, (code)(token_contract))
FC_REFLECT(eosio::handlepay_apis::read_only::get_fee_pools_results, (pools))
