/**
 * handlevault implementation. Balances are zeroed before any payout is sent and rows are never erased.
 *
 * @copyright defined in handlepay/LICENSE.txt
 */

#include "handle.vault.hpp"

handlevault::handlevault(account_name self) : contract(self), configs(_self, _self) {
    if (!configs.exists()) {
        _config = config{
            _self, //owner
            _self, //fee_receiver
            0, //registry
            N(eosio.token), //native_contract
            symbol_type(S(4, TLOS)).name(), //native_sym_code
            DEFAULT_FEE_BPS //fee_bps
        };

        configs.set(_config, _self);
    } else {
        _config = configs.get();
    }
}

handlevault::~handlevault() {
    if (configs.exists()) {
        configs.set(_config, _self);
    }
}

#pragma region Deposits

void handlevault::ontransfer(account_name token_contract, transfer_args args) {
    //NOTE: settlement pulls are credited by the batch action that sent them
    if (args.to != _self || args.from == _self || args.memo == SETTLEMENT_MEMO) {
        return;
    }

    call_guard guard(_self);

    eosio_assert(args.quantity.is_valid() && args.quantity.amount > 0, "InvalidAmount: deposit amount must be positive");
    eosio_assert(!args.memo.empty(), "InvalidHandle: handle cannot be empty");

    //NOTE: notifications cannot bill another account, rows opened by a plain transfer are paid by the vault
    credit(args.memo, token_contract, args.quantity, _self);

    print("\nDeposit: ", name{args.from}, " -> ", args.memo, " ", args.quantity);
}

void handlevault::batchdeposit(account_name payer, vector<string> handles, vector<asset> amounts, asset total) {
    eosio_assert(total.symbol.name() == _config.native_sym_code, "InvalidAmount: total must be in the native token");

    batchdeptk(payer, _config.native_contract, handles, amounts, total);
}

void handlevault::batchdeptk(account_name payer, account_name token_contract, vector<string> handles, vector<asset> amounts, asset total) {
    require_auth(payer);
    call_guard guard(_self);

    eosio_assert(handles.size() == amounts.size(), "LengthMismatch: handles and amounts differ in length");
    eosio_assert(!handles.empty(), "EmptyBatch: batch has no handles");
    eosio_assert(total.is_valid() && total.amount > 0, "InvalidAmount: batch total must be positive");
    eosio_assert(sum_amounts(amounts, total.symbol) == total, "AmountMismatch: amounts do not sum to total");

    for (size_t i = 0; i < handles.size(); i++) {
        eosio_assert(!handles[i].empty(), "InvalidHandle: handle cannot be empty");
        credit(handles[i], token_contract, amounts[i], payer);
    }

    //NOTE: one pull for the whole batch
    action(permission_level{ payer, N(active) }, token_contract, N(transfer), make_tuple(
        payer,
        _self,
        total,
        SETTLEMENT_MEMO
    )).send();

    print("\nBatch Deposit: ", name{payer}, " ", uint64_t(handles.size()), " handles ", total);
}

#pragma endregion Deposits

#pragma region Withdrawals

void handlevault::withdraw(account_name owner, string handle) {
    require_auth(owner);
    call_guard guard(_self);

    registry_resolver resolver(_config.registry);
    require_owner(resolver, owner, handle);

    eosio_assert(settle(owner, handle, native_token()), "NothingToWithdraw: no native balance for handle");
}

void handlevault::withdrawtk(account_name owner, string handle, token_ref token) {
    require_auth(owner);
    call_guard guard(_self);

    registry_resolver resolver(_config.registry);
    require_owner(resolver, owner, handle);

    eosio_assert(settle(owner, handle, token), "NothingToWithdraw: no balance for handle in token");
}

void handlevault::withdrawall(account_name owner, string handle, vector<token_ref> tokens) {
    require_auth(owner);
    call_guard guard(_self);

    registry_resolver resolver(_config.registry);
    require_owner(resolver, owner, handle);

    bool withdrew = settle(owner, handle, native_token());

    for (const auto& t : tokens) {
        if (settle(owner, handle, t)) { //NOTE: unfunded tokens are skipped
            withdrew = true;
        }
    }

    eosio_assert(withdrew, "NothingToWithdraw: handle holds no balance in the listed tokens");
}

#pragma endregion Withdrawals

#pragma region Fee_Claims

void handlevault::claimfees(token_ref token) {
    require_auth(_config.fee_receiver);

    asset claimed = claim_pool(token);
    eosio_assert(claimed.amount > 0, "NothingToClaim: no fees accumulated for token");
}

void handlevault::claimmany(vector<token_ref> tokens) {
    require_auth(_config.fee_receiver);

    for (const auto& t : tokens) {
        claim_pool(t);
    }
}

void handlevault::claimnative() {
    require_auth(_config.fee_receiver);

    asset claimed = claim_pool(native_token());
    eosio_assert(claimed.amount > 0, "NothingToClaim: no native fees accumulated");
}

#pragma endregion Fee_Claims

#pragma region Admin

void handlevault::setfeerate(uint16_t fee_bps) {
    require_auth(_config.owner);
    eosio_assert(fee_bps <= MAX_VAULT_FEE_BPS, "FeeTooHigh: vault fee cannot exceed 1000 bps");

    print("\nFee Rate: ", uint64_t(_config.fee_bps), " -> ", uint64_t(fee_bps));
    _config.fee_bps = fee_bps;
}

void handlevault::setreceiver(account_name fee_receiver) {
    require_auth(_config.owner);
    eosio_assert(is_account(fee_receiver), "InvalidAddress: fee receiver account does not exist");

    print("\nFee Receiver: ", name{_config.fee_receiver}, " -> ", name{fee_receiver});
    _config.fee_receiver = fee_receiver;
}

void handlevault::setregistry(account_name registry) {
    require_auth(_config.owner);
    eosio_assert(is_account(registry), "InvalidAddress: registry account does not exist");

    print("\nRegistry: ", name{_config.registry}, " -> ", name{registry});
    _config.registry = registry;
}

void handlevault::setnative(token_ref native) {
    require_auth(_config.owner);
    eosio_assert(is_account(native.contract), "InvalidAddress: native token contract does not exist");

    _config.native_contract = native.contract;
    _config.native_sym_code = native.sym_code;

    print("\nNative Token Set: ", name{native.contract});
}

void handlevault::setowner(account_name new_owner) {
    require_auth(_config.owner);
    eosio_assert(is_account(new_owner), "InvalidAddress: new owner account does not exist");

    print("\nOwner: ", name{_config.owner}, " -> ", name{new_owner});
    _config.owner = new_owner;
}

#pragma endregion Admin

#pragma region Helper_Functions

handlevault::balances_table::const_iterator handlevault::find_balance(balances_table& balances, const checksum256& digest,
    account_name token_contract, uint64_t sym_code) {
    return find_if(balances.begin(), balances.end(), [&](const vault_balance& b) {
        return b.contract == token_contract && b.balance.symbol.name() == sym_code && same_hash(b.handle_hash, digest);
    });
}

void handlevault::credit(const string& handle, account_name token_contract, asset quantity, account_name ram_payer) {
    checksum256 digest = handle_hash(handle);
    balances_table balances(_self, handle_key(digest));
    auto itr = find_balance(balances, digest, token_contract, quantity.symbol.name());

    if (itr == balances.end()) {
        balances.emplace(ram_payer, [&]( auto& a ){
            a.id = balances.available_primary_key();
            a.handle_hash = digest;
            a.contract = token_contract;
            a.balance = quantity;
        });
    } else {
        balances.modify(itr, 0, [&]( auto& a ) {
            a.balance += quantity; //NOTE: asserts on precision mismatch and overflow
        });
    }
}

/**
 * Pays out the full balance the handle holds in token, minus the vault fee. Returns false when there is
 * nothing to pay.
 */
bool handlevault::settle(account_name owner, const string& handle, const token_ref& token) {
    checksum256 digest = handle_hash(handle);
    balances_table balances(_self, handle_key(digest));
    auto itr = find_balance(balances, digest, token.contract, token.sym_code);

    if (itr == balances.end() || itr->balance.amount == 0) {
        return false;
    }

    asset held = itr->balance;
    asset fee = asset(fee_of(held.amount, _config.fee_bps), held.symbol);
    asset net = held - fee;

    balances.modify(itr, 0, [&]( auto& a ) {
        a.balance.amount = 0;
    });

    accrue_fee(_self, token.contract, fee, owner);
    send_tokens(token.contract, _self, owner, net, string("handlevault: ") + handle);

    print("\nWithdraw: ", name{owner}, " <- ", handle, " net ", net, " fee ", fee);

    return true;
}

void handlevault::require_owner(const identity_resolver& resolver, account_name owner, const string& handle) {
    eosio_assert(!handle.empty(), "InvalidHandle: handle cannot be empty");
    eosio_assert(resolver.resolve(handle) == owner, "Unauthorized: caller does not own handle");
}

asset handlevault::claim_pool(const token_ref& token) {
    call_guard guard(_self);

    asset owed = drain_fee(_self, token);

    if (owed.amount > 0) {
        send_tokens(token.contract, _self, _config.fee_receiver, owed, string("handlevault fees"));
        print("\nFees Claimed: ", name{_config.fee_receiver}, " ", owed);
    }

    return owed;
}

token_ref handlevault::native_token() const {
    return token_ref{ _config.native_contract, _config.native_sym_code };
}

#pragma endregion Helper_Functions

extern "C" {
    void apply(uint64_t self, uint64_t code, uint64_t action) {
        handlevault vault(self);
        if (code == self && action == N(batchdeposit)) {
            execute_action(&vault, &handlevault::batchdeposit);
        } else if (code == self && action == N(batchdeptk)) {
            execute_action(&vault, &handlevault::batchdeptk);
        } else if (code == self && action == N(withdraw)) {
            execute_action(&vault, &handlevault::withdraw);
        } else if (code == self && action == N(withdrawtk)) {
            execute_action(&vault, &handlevault::withdrawtk);
        } else if (code == self && action == N(withdrawall)) {
            execute_action(&vault, &handlevault::withdrawall);
        } else if (code == self && action == N(claimfees)) {
            execute_action(&vault, &handlevault::claimfees);
        } else if (code == self && action == N(claimmany)) {
            execute_action(&vault, &handlevault::claimmany);
        } else if (code == self && action == N(claimnative)) {
            execute_action(&vault, &handlevault::claimnative);
        } else if (code == self && action == N(setfeerate)) {
            execute_action(&vault, &handlevault::setfeerate);
        } else if (code == self && action == N(setreceiver)) {
            execute_action(&vault, &handlevault::setreceiver);
        } else if (code == self && action == N(setregistry)) {
            execute_action(&vault, &handlevault::setregistry);
        } else if (code == self && action == N(setnative)) {
            execute_action(&vault, &handlevault::setnative);
        } else if (code == self && action == N(setowner)) {
            execute_action(&vault, &handlevault::setowner);
        } else if (code != self && action == N(transfer)) {
            vault.ontransfer(code, unpack_action_data<transfer_args>());
        }
    } //end apply
}; //end dispatcher
