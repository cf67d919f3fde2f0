/**
 * Token contract definitions used to move value in and out of the handlepay contracts. Mirrors the
 * accounts table and transfer action of eosio.token.
 *
 * @copyright defined in handlepay/LICENSE.txt
 */
#pragma once

#include <eosiolib/eosio.hpp>
#include <eosiolib/asset.hpp>
#include <eosiolib/action.hpp>
#include <eosiolib/types.hpp>

#include <string>

using namespace std;
using namespace eosio;

//NOTE: incoming transfers carrying this memo are settlement pulls and never credit a handle
const string SETTLEMENT_MEMO = "handlepay settlement";

struct account {
    asset    balance;

    uint64_t primary_key() const { return balance.symbol.name(); }
};

struct transfer_args {
    account_name  from;
    account_name  to;
    asset         quantity;
    string        memo;

    EOSLIB_SERIALIZE(transfer_args, (from)(to)(quantity)(memo))
};

typedef eosio::multi_index<N(accounts), account> accounts;

/**
 * Returns the balance owner holds in token_contract for sym_code, or a zero asset if there is no row.
 */
asset get_token_balance(account_name token_contract, account_name owner, uint64_t sym_code) {
    accounts accountstable(token_contract, owner);
    auto a = accountstable.find(sym_code);

    if (a == accountstable.end()) {
        return asset();
    }

    return a->balance;
}

/**
 * Sends an inline transfer on token_contract authorized by from@active. A pull from a user account needs
 * that account to grant the calling contract's eosio.code permission.
 */
void send_tokens(account_name token_contract, account_name from, account_name to, asset quantity, string memo) {
    eosio_assert(is_account(to), "TransferFailed: recipient account does not exist");

    action(permission_level{ from, N(active) }, token_contract, N(transfer), make_tuple(
        from,
        to,
        quantity,
        memo
    )).send();
}
