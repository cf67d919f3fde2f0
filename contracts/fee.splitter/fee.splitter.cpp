/**
 * feesplitter implementation.
 *
 * @copyright defined in handlepay/LICENSE.txt
 */

#include "fee.splitter.hpp"

feesplitter::feesplitter(account_name self) : contract(self), configs(_self, _self) {
    if (!configs.exists()) {
        _config = config{
            _self, //admin
            0, //stakeholder1
            1000, //share1
            0, //stakeholder2
            9000, //share2
            N(handlepay), //dispatcher
            N(handlevault), //vault
            false //initialized
        };

        configs.set(_config, _self);
    } else {
        _config = configs.get();
    }
}

feesplitter::~feesplitter() {
    if (configs.exists()) {
        configs.set(_config, _self);
    }
}

void feesplitter::init(account_name admin, account_name stakeholder1, uint16_t share1, account_name stakeholder2, uint16_t share2) {
    require_auth(_self);
    eosio_assert(!_config.initialized, "AlreadyInitialized: distributor is already initialized");
    eosio_assert(is_account(admin), "InvalidAddress: admin account does not exist");
    eosio_assert(is_account(stakeholder1) && is_account(stakeholder2), "InvalidAddress: stakeholder account does not exist");
    eosio_assert(stakeholder1 != stakeholder2, "InvalidShares: stakeholders must be different accounts");
    eosio_assert(uint32_t(share1) + share2 == BPS_DENOMINATOR, "InvalidShares: shares must sum to 10000 bps");

    _config.admin = admin;
    _config.stakeholder1 = stakeholder1;
    _config.share1 = share1;
    _config.stakeholder2 = stakeholder2;
    _config.share2 = share2;
    _config.initialized = true;

    print("\nDistributor Initialized: ", name{stakeholder1}, " ", uint64_t(share1), " bps, ", name{stakeholder2}, " ", uint64_t(share2), " bps");
}

void feesplitter::setadmin(account_name new_admin) {
    require_auth(_config.admin);
    eosio_assert(is_account(new_admin), "InvalidAddress: admin account does not exist");

    print("\nAdmin: ", name{_config.admin}, " -> ", name{new_admin});
    _config.admin = new_admin;
}

void feesplitter::setsources(account_name dispatcher, account_name vault) {
    require_auth(_config.admin);
    eosio_assert(is_account(dispatcher) && is_account(vault), "InvalidAddress: fee source account does not exist");

    _config.dispatcher = dispatcher;
    _config.vault = vault;

    print("\nFee Sources: ", name{dispatcher}, ", ", name{vault});
}

void feesplitter::pull(account_name caller, token_ref token) {
    require_puller(caller);

    pull_from(_config.dispatcher, caller, token);
}

void feesplitter::pullmany(account_name caller, vector<token_ref> tokens) {
    require_puller(caller);

    pull_many_from(_config.dispatcher, caller, tokens);
}

void feesplitter::pullvault(account_name caller, token_ref token) {
    require_puller(caller);

    pull_from(_config.vault, caller, token);
}

void feesplitter::pullvaultmny(account_name caller, vector<token_ref> tokens) {
    require_puller(caller);

    pull_many_from(_config.vault, caller, tokens);
}

void feesplitter::claimshare(account_name stakeholder, token_ref token) {
    require_auth(stakeholder);
    eosio_assert(_config.initialized, "NotInitialized: distributor is not initialized");
    call_guard guard(_self);

    uint16_t share = share_of(stakeholder);
    asset held = get_token_balance(token.contract, _self, token.sym_code);

    int64_t amount = int64_t((uint128_t(held.amount) * share) / BPS_DENOMINATOR);
    eosio_assert(amount > 0, "NothingToClaim: no share available for token");

    asset payout = asset(amount, held.symbol);
    send_tokens(token.contract, _self, stakeholder, payout, string("fee share"));

    print("\nShare Claimed: ", name{stakeholder}, " ", payout, " of ", held);
}

#pragma region Helper_Functions

void feesplitter::pull_from(account_name source, account_name caller, const token_ref& token) {
    call_guard guard(_self);

    asset owed = get_fee_pool(source, token);
    eosio_assert(owed.amount > 0, "NothingToClaim: source has no fees for token");

    action(permission_level{ _self, N(active) }, source, N(claimfees), make_tuple(
        token
    )).send();

    print("\nPulled Fees: ", name{caller}, " from ", name{source}, " ", owed);
}

void feesplitter::pull_many_from(account_name source, account_name caller, const vector<token_ref>& tokens) {
    call_guard guard(_self);

    vector<token_ref> funded;

    for (const auto& t : tokens) {
        asset owed = get_fee_pool(source, t);

        if (owed.amount > 0) {
            funded.push_back(t);
            print("\nPulled Fees: ", name{caller}, " from ", name{source}, " ", owed);
        }
    }

    if (!funded.empty()) {
        action(permission_level{ _self, N(active) }, source, N(claimmany), make_tuple(
            funded
        )).send();
    }
}

void feesplitter::require_puller(account_name caller) {
    require_auth(caller);
    eosio_assert(_config.initialized, "NotInitialized: distributor is not initialized");
    eosio_assert(caller == _config.stakeholder1 || caller == _config.stakeholder2 || caller == _config.admin,
        "Unauthorized: caller is not a stakeholder or the admin");
}

uint16_t feesplitter::share_of(account_name stakeholder) {
    if (stakeholder == _config.stakeholder1) {
        return _config.share1;
    }

    eosio_assert(stakeholder == _config.stakeholder2, "Unauthorized: caller is not a stakeholder");
    return _config.share2;
}

#pragma endregion Helper_Functions

EOSIO_ABI(feesplitter, (init)(setadmin)(setsources)(pull)(pullmany)(pullvault)(pullvaultmny)(claimshare))
