/**
 * The feesplitter contract collects the fees accumulated by the handlepay dispatcher (and optionally the
 * vault) and splits whatever it currently holds between two stakeholders at fixed basis point shares.
 * Shares are computed against the live balance at claim time, so the order of claims affects the exact
 * payout when new fees arrive in between.
 *
 * @copyright defined in handlepay/LICENSE.txt
 */

#include <../handle.pay/handle.connections/handleconn.fees.hpp>
#include <../handle.pay/handle.connections/handleconn.tokens.hpp>
#include <../handle.pay/handle.connections/handleconn.guard.hpp>

#include <eosiolib/eosio.hpp>
#include <eosiolib/permission.hpp>
#include <eosiolib/asset.hpp>
#include <eosiolib/action.hpp>
#include <eosiolib/types.hpp>
#include <eosiolib/singleton.hpp>

using namespace std;
using namespace eosio;

class feesplitter : public contract {
    public:

        /// @abi table config i64
        struct config {
            account_name admin;
            account_name stakeholder1;
            uint16_t share1;
            account_name stakeholder2;
            uint16_t share2;
            account_name dispatcher;
            account_name vault;
            bool initialized;

            uint64_t primary_key() const { return admin; }
            EOSLIB_SERIALIZE(config, (admin)(stakeholder1)(share1)(stakeholder2)(share2)(dispatcher)(vault)(initialized))
        };

        feesplitter(account_name self);

        ~feesplitter();

        /// @abi action
        void init(account_name admin, account_name stakeholder1, uint16_t share1, account_name stakeholder2, uint16_t share2);

        /// @abi action
        void setadmin(account_name new_admin);

        /// @abi action
        void setsources(account_name dispatcher, account_name vault);

        /// @abi action
        void pull(account_name caller, token_ref token);

        /// @abi action
        void pullmany(account_name caller, vector<token_ref> tokens);

        /// @abi action
        void pullvault(account_name caller, token_ref token);

        /// @abi action
        void pullvaultmny(account_name caller, vector<token_ref> tokens);

        /// @abi action
        void claimshare(account_name stakeholder, token_ref token);

    protected:

        void pull_from(account_name source, account_name caller, const token_ref& token);

        void pull_many_from(account_name source, account_name caller, const vector<token_ref>& tokens);

        void require_puller(account_name caller);

        uint16_t share_of(account_name stakeholder);

        #pragma region Tables

        typedef singleton<N(config), config> config_singleton;
        config_singleton configs;
        config _config;

        #pragma endregion Tables
};
