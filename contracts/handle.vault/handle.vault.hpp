/**
 * The handlevault contract holds tokens for handles that are not registered yet. Anyone can deposit for any
 * handle; only the account the registry currently maps the handle to can withdraw, and a withdrawal always
 * drains the whole balance of one token minus the vault fee.
 *
 * @copyright defined in handlepay/LICENSE.txt
 */

#include <../handle.pay/handle.connections/handleconn.fees.hpp>
#include <../handle.pay/handle.connections/handleconn.tokens.hpp>
#include <../handle.pay/handle.connections/handleconn.ledger.hpp>
#include <../handle.pay/handle.connections/handleconn.registry.hpp>
#include <../handle.pay/handle.connections/handleconn.guard.hpp>

#include <eosiolib/eosio.hpp>
#include <eosiolib/permission.hpp>
#include <eosiolib/asset.hpp>
#include <eosiolib/action.hpp>
#include <eosiolib/types.hpp>
#include <eosiolib/singleton.hpp>

#include <algorithm>

using namespace std;
using namespace eosio;

class handlevault : public contract {
    public:

        /// @abi table config i64
        struct config {
            account_name owner;
            account_name fee_receiver;
            account_name registry;
            account_name native_contract;
            uint64_t native_sym_code;
            uint16_t fee_bps;

            uint64_t primary_key() const { return owner; }
            EOSLIB_SERIALIZE(config, (owner)(fee_receiver)(registry)(native_contract)(native_sym_code)(fee_bps))
        };

        //NOTE: scope is handle_key(handle_hash), rows for one scope are told apart by the full digest
        /// @abi table balances i64
        struct vault_balance {
            uint64_t id;
            checksum256 handle_hash;
            account_name contract;
            asset balance;

            uint64_t primary_key() const { return id; }
            EOSLIB_SERIALIZE(vault_balance, (id)(handle_hash)(contract)(balance))
        };

        handlevault(account_name self);

        ~handlevault();

        #pragma region Deposits

        void ontransfer(account_name token_contract, transfer_args args); //NOTE: memo carries the handle

        /// @abi action
        void batchdeposit(account_name payer, vector<string> handles, vector<asset> amounts, asset total);

        /// @abi action
        void batchdeptk(account_name payer, account_name token_contract, vector<string> handles, vector<asset> amounts, asset total);

        #pragma endregion Deposits

        #pragma region Withdrawals

        /// @abi action
        void withdraw(account_name owner, string handle);

        /// @abi action
        void withdrawtk(account_name owner, string handle, token_ref token);

        /// @abi action
        void withdrawall(account_name owner, string handle, vector<token_ref> tokens);

        #pragma endregion Withdrawals

        #pragma region Fee_Claims

        /// @abi action
        void claimfees(token_ref token);

        /// @abi action
        void claimmany(vector<token_ref> tokens);

        /// @abi action
        void claimnative();

        #pragma endregion Fee_Claims

        #pragma region Admin

        /// @abi action
        void setfeerate(uint16_t fee_bps);

        /// @abi action
        void setreceiver(account_name fee_receiver);

        /// @abi action
        void setregistry(account_name registry);

        /// @abi action
        void setnative(token_ref native);

        /// @abi action
        void setowner(account_name new_owner);

        #pragma endregion Admin

    protected:

        #pragma region Tables

        typedef singleton<N(config), config> config_singleton;
        config_singleton configs;
        config _config;

        typedef multi_index<N(balances), vault_balance> balances_table;

        #pragma endregion Tables

        #pragma region Helper_Functions

        balances_table::const_iterator find_balance(balances_table& balances, const checksum256& digest,
            account_name token_contract, uint64_t sym_code);

        void credit(const string& handle, account_name token_contract, asset quantity, account_name ram_payer);

        bool settle(account_name owner, const string& handle, const token_ref& token);

        void require_owner(const identity_resolver& resolver, account_name owner, const string& handle);

        asset claim_pool(const token_ref& token);

        token_ref native_token() const;

        #pragma endregion Helper_Functions
};
