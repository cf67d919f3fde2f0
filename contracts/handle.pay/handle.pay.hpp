/**
 * The handlepay contract is the dispatcher of the handlepay protocol. Tokens sent to it with a handle in the
 * memo are paid to the account that owns the handle, minus a fee kept in the dispatcher fee pool. When the
 * handle is not registered yet the full amount is forwarded to the vault and held there for the handle.
 * Batches pay registered accounts and escrow unregistered handles in a single all-or-nothing action.
 *
 * @copyright defined in handlepay/LICENSE.txt
 */

#include "handle.connections/handleconn.fees.hpp"
#include "handle.connections/handleconn.tokens.hpp"
#include "handle.connections/handleconn.registry.hpp"
#include "handle.connections/handleconn.guard.hpp"

#include <eosiolib/eosio.hpp>
#include <eosiolib/permission.hpp>
#include <eosiolib/asset.hpp>
#include <eosiolib/action.hpp>
#include <eosiolib/types.hpp>
#include <eosiolib/singleton.hpp>

using namespace std;
using namespace eosio;

class handlepay : public contract {
    public:

        /// @abi table config i64
        struct config {
            account_name owner;
            account_name fee_receiver;
            account_name registry;
            account_name vault;
            account_name native_contract;
            uint64_t native_sym_code;
            uint16_t fee_bps;

            uint64_t primary_key() const { return owner; }
            EOSLIB_SERIALIZE(config, (owner)(fee_receiver)(registry)(vault)(native_contract)(native_sym_code)(fee_bps))
        };

        handlepay(account_name self);

        ~handlepay();

        #pragma region Transfers

        void ontransfer(account_name token_contract, transfer_args args); //NOTE: memo carries the recipient handle

        /// @abi action
        void batchsend(account_name sender, vector<string> handles, vector<asset> vault_amounts,
            vector<account_name> recipients, vector<asset> direct_amounts, asset total);

        /// @abi action
        void batchsendtk(account_name sender, account_name token_contract, vector<string> handles, vector<asset> vault_amounts,
            vector<account_name> recipients, vector<asset> direct_amounts, asset total);

        #pragma endregion Transfers

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
        void setvault(account_name vault);

        /// @abi action
        void setnative(token_ref native);

        /// @abi action
        void setowner(account_name new_owner);

        #pragma endregion Admin

    protected:

        void dispatch_batch(account_name sender, account_name token_contract, const vector<string>& handles,
            const vector<asset>& vault_amounts, const vector<account_name>& recipients,
            const vector<asset>& direct_amounts, asset total);

        asset claim_pool(const token_ref& token);

        token_ref native_token() const;

        #pragma region Tables

        typedef singleton<N(config), config> config_singleton;
        config_singleton configs;
        config _config;

        #pragma endregion Tables
};
