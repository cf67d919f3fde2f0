/**
 * Fee arithmetic and fee pool layout shared by the handlepay contracts. Contracts that want to read the
 * fees accumulated by the dispatcher or the vault include this file and open the feepools table of the
 * component with the token contract as scope.
 *
 * @copyright defined in handlepay/LICENSE.txt
 */
#pragma once

#include <eosiolib/eosio.hpp>
#include <eosiolib/asset.hpp>
#include <eosiolib/types.hpp>

#include <vector>

using namespace std;
using namespace eosio;

const uint16_t BPS_DENOMINATOR = 10000;
const uint16_t MAX_DISPATCH_FEE_BPS = 300; //3%
const uint16_t MAX_VAULT_FEE_BPS = 1000; //10%
const uint16_t DEFAULT_FEE_BPS = 100;

/**
 * @brief Identifies a fungible token: the contract that issues it and its symbol code.
 * @field contract - account of the token contract
 * @field sym_code - symbol code, as returned by symbol_type::name()
 */
struct token_ref {
    account_name contract;
    uint64_t sym_code;

    EOSLIB_SERIALIZE(token_ref, (contract)(sym_code))
};

/**
 * @brief Fees accumulated for one token. Table code is the collecting component, scope is the token contract.
 */
/// @abi table feepools i64
struct fee_pool {
    asset balance;

    uint64_t primary_key() const { return balance.symbol.name(); }
    EOSLIB_SERIALIZE(fee_pool, (balance))
};

typedef multi_index<N(feepools), fee_pool> feepools_table;

int64_t fee_of(int64_t amount, uint16_t fee_bps) {
    return int64_t((uint128_t(amount) * fee_bps) / BPS_DENOMINATOR);
}

/**
 * Net share of amount rounded down, floor(amount * (10000 - fee_bps) / 10000). Batch payouts use this so the
 * rounding remainder of every entry ends up in the fee.
 */
int64_t net_floor_of(int64_t amount, uint16_t fee_bps) {
    return int64_t((uint128_t(amount) * (BPS_DENOMINATOR - fee_bps)) / BPS_DENOMINATOR);
}

/**
 * Sums a list of batch amounts. Every entry must be positive and carry sym.
 * Overflow is caught by asset::operator+=.
 */
asset sum_amounts(const vector<asset>& amounts, symbol_type sym) {
    asset total(0, sym);

    for (const auto& a : amounts) {
        eosio_assert(a.is_valid(), "InvalidAmount: invalid quantity in batch");
        eosio_assert(a.symbol == sym, "InvalidAmount: batch entry symbol does not match total");
        eosio_assert(a.amount > 0, "InvalidAmount: batch entries must be positive");
        total += a;
    }

    return total;
}

asset get_fee_pool(account_name component, const token_ref& token) {
    feepools_table pools(component, token.contract);
    auto p = pools.find(token.sym_code);

    if (p == pools.end()) {
        return asset();
    }

    return p->balance;
}

/**
 * Adds fee to the pool kept by component. Zero fees leave the table untouched. A new pool row is billed to
 * ram_payer, which must be component or an account that authorized the action.
 */
void accrue_fee(account_name component, account_name token_contract, asset fee, account_name ram_payer) {
    if (fee.amount == 0) {
        return;
    }

    feepools_table pools(component, token_contract);
    auto p = pools.find(fee.symbol.name());

    if (p == pools.end()) {
        pools.emplace(ram_payer, [&]( auto& a ){
            a.balance = fee;
        });
    } else {
        pools.modify(p, 0, [&]( auto& a ) {
            a.balance += fee;
        });
    }
}

/**
 * Zeroes the pool for token and returns what it held. The row is kept at zero, never erased.
 */
asset drain_fee(account_name component, const token_ref& token) {
    feepools_table pools(component, token.contract);
    auto p = pools.find(token.sym_code);

    if (p == pools.end() || p->balance.amount == 0) {
        return asset();
    }

    asset owed = p->balance;

    pools.modify(p, 0, [&]( auto& a ) {
        a.balance.amount = 0;
    });

    return owed;
}
