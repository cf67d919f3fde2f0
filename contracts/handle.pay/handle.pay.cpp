/**
 * handlepay implementation.
 *
 * @copyright defined in handlepay/LICENSE.txt
 */

#include "handle.pay.hpp"

handlepay::handlepay(account_name self) : contract(self), configs(_self, _self) {
    if (!configs.exists()) {
        _config = config{
            _self, //owner
            _self, //fee_receiver
            0, //registry
            N(handlevault), //vault
            N(eosio.token), //native_contract
            symbol_type(S(4, TLOS)).name(), //native_sym_code
            DEFAULT_FEE_BPS //fee_bps
        };

        configs.set(_config, _self);
    } else {
        _config = configs.get();
    }
}

handlepay::~handlepay() {
    if (configs.exists()) {
        configs.set(_config, _self);
    }
}

#pragma region Transfers

void handlepay::ontransfer(account_name token_contract, transfer_args args) {
    //NOTE: outgoing payouts and batch pulls come back as notifications
    if (args.to != _self || args.from == _self || args.memo == SETTLEMENT_MEMO) {
        return;
    }

    call_guard guard(_self);

    eosio_assert(args.quantity.is_valid() && args.quantity.amount > 0, "InvalidAmount: transfer amount must be positive");
    eosio_assert(!args.memo.empty(), "InvalidHandle: handle cannot be empty");

    const string& handle = args.memo;
    registry_resolver resolver(_config.registry);
    account_name owner = resolver.resolve(handle);

    if (owner != 0) {
        asset fee = asset(fee_of(args.quantity.amount, _config.fee_bps), args.quantity.symbol);
        asset net = args.quantity - fee;

        accrue_fee(_self, token_contract, fee, _self);
        send_tokens(token_contract, _self, owner, net, string("handlepay: ") + handle);

        print("\nTransfer: ", name{args.from}, " -> ", handle, " (", name{owner}, ") net ", net, " fee ", fee);
    } else {
        //NOTE: escrow is fee-free, the vault charges at withdrawal
        send_tokens(token_contract, _self, _config.vault, args.quantity, handle);

        print("\nEscrowed: ", name{args.from}, " -> ", handle, " ", args.quantity);
    }
}

void handlepay::batchsend(account_name sender, vector<string> handles, vector<asset> vault_amounts,
    vector<account_name> recipients, vector<asset> direct_amounts, asset total) {
    require_auth(sender);
    eosio_assert(total.symbol.name() == _config.native_sym_code, "InvalidAmount: total must be in the native token");

    dispatch_batch(sender, _config.native_contract, handles, vault_amounts, recipients, direct_amounts, total);
}

void handlepay::batchsendtk(account_name sender, account_name token_contract, vector<string> handles, vector<asset> vault_amounts,
    vector<account_name> recipients, vector<asset> direct_amounts, asset total) {
    require_auth(sender);
    eosio_assert(is_account(token_contract), "InvalidAddress: token contract does not exist");

    dispatch_batch(sender, token_contract, handles, vault_amounts, recipients, direct_amounts, total);
}

#pragma endregion Transfers

#pragma region Fee_Claims

void handlepay::claimfees(token_ref token) {
    require_auth(_config.fee_receiver);

    asset claimed = claim_pool(token);
    eosio_assert(claimed.amount > 0, "NothingToClaim: no fees accumulated for token");
}

void handlepay::claimmany(vector<token_ref> tokens) {
    require_auth(_config.fee_receiver);

    for (const auto& t : tokens) {
        claim_pool(t); //NOTE: empty pools are skipped
    }
}

void handlepay::claimnative() {
    require_auth(_config.fee_receiver);

    asset claimed = claim_pool(native_token());
    eosio_assert(claimed.amount > 0, "NothingToClaim: no native fees accumulated");
}

#pragma endregion Fee_Claims

#pragma region Admin

void handlepay::setfeerate(uint16_t fee_bps) {
    require_auth(_config.owner);
    eosio_assert(fee_bps <= MAX_DISPATCH_FEE_BPS, "FeeTooHigh: dispatcher fee cannot exceed 300 bps");

    print("\nFee Rate: ", uint64_t(_config.fee_bps), " -> ", uint64_t(fee_bps));
    _config.fee_bps = fee_bps;
}

void handlepay::setreceiver(account_name fee_receiver) {
    require_auth(_config.owner);
    eosio_assert(is_account(fee_receiver), "InvalidAddress: fee receiver account does not exist");

    print("\nFee Receiver: ", name{_config.fee_receiver}, " -> ", name{fee_receiver});
    _config.fee_receiver = fee_receiver;
}

void handlepay::setregistry(account_name registry) {
    require_auth(_config.owner);
    eosio_assert(is_account(registry), "InvalidAddress: registry account does not exist");

    print("\nRegistry: ", name{_config.registry}, " -> ", name{registry});
    _config.registry = registry;
}

void handlepay::setvault(account_name vault) {
    require_auth(_config.owner);
    eosio_assert(is_account(vault), "InvalidAddress: vault account does not exist");

    print("\nVault: ", name{_config.vault}, " -> ", name{vault});
    _config.vault = vault;
}

void handlepay::setnative(token_ref native) {
    require_auth(_config.owner);
    eosio_assert(is_account(native.contract), "InvalidAddress: native token contract does not exist");

    _config.native_contract = native.contract;
    _config.native_sym_code = native.sym_code;

    print("\nNative Token Set: ", name{native.contract});
}

void handlepay::setowner(account_name new_owner) {
    require_auth(_config.owner);
    eosio_assert(is_account(new_owner), "InvalidAddress: new owner account does not exist");

    print("\nOwner: ", name{_config.owner}, " -> ", name{new_owner});
    _config.owner = new_owner;
}

#pragma endregion Admin

#pragma region Helper_Functions

void handlepay::dispatch_batch(account_name sender, account_name token_contract, const vector<string>& handles,
    const vector<asset>& vault_amounts, const vector<account_name>& recipients,
    const vector<asset>& direct_amounts, asset total) {
    call_guard guard(_self);

    eosio_assert(handles.size() == vault_amounts.size(), "LengthMismatch: handles and vault amounts differ in length");
    eosio_assert(recipients.size() == direct_amounts.size(), "LengthMismatch: recipients and direct amounts differ in length");
    eosio_assert(handles.size() + recipients.size() > 0, "EmptyBatch: batch has no recipients");
    eosio_assert(total.is_valid() && total.amount > 0, "InvalidAmount: batch total must be positive");

    for (const auto& h : handles) {
        eosio_assert(!h.empty(), "InvalidHandle: handle cannot be empty");
    }

    for (const auto& r : recipients) {
        eosio_assert(r != 0, "InvalidAddress: recipient cannot be empty");
    }

    asset vault_total = sum_amounts(vault_amounts, total.symbol);
    asset direct_total = sum_amounts(direct_amounts, total.symbol);
    eosio_assert(vault_total + direct_total == total, "AmountMismatch: batch amounts do not sum to total");

    //NOTE: each payout is rounded down on its own, the rounding dust stays with the fee
    vector<asset> payouts;
    asset paid = asset(0, total.symbol);

    for (const auto& a : direct_amounts) {
        asset net = asset(net_floor_of(a.amount, _config.fee_bps), a.symbol);
        paid += net;
        payouts.push_back(net);
    }

    asset fee = direct_total - paid;
    accrue_fee(_self, token_contract, fee, sender);

    action(permission_level{ sender, N(active) }, token_contract, N(transfer), make_tuple(
        sender,
        _self,
        total,
        SETTLEMENT_MEMO
    )).send();

    for (size_t i = 0; i < recipients.size(); i++) {
        send_tokens(token_contract, _self, recipients[i], payouts[i], string("handlepay batch"));
    }

    if (!handles.empty()) {
        action(permission_level{ _self, N(active) }, _config.vault, N(batchdeptk), make_tuple(
            _self,
            token_contract,
            handles,
            vault_amounts,
            vault_total
        )).send();
    }

    print("\nBatch Transfer: ", name{sender}, " direct ", direct_total, " escrowed ", vault_total, " fee ", fee);
}

asset handlepay::claim_pool(const token_ref& token) {
    call_guard guard(_self);

    asset owed = drain_fee(_self, token);

    if (owed.amount > 0) {
        send_tokens(token.contract, _self, _config.fee_receiver, owed, string("handlepay fees"));
        print("\nFees Claimed: ", name{_config.fee_receiver}, " ", owed);
    }

    return owed;
}

token_ref handlepay::native_token() const {
    return token_ref{ _config.native_contract, _config.native_sym_code };
}

#pragma endregion Helper_Functions

extern "C" {
    void apply(uint64_t self, uint64_t code, uint64_t action) {
        handlepay dispatcher(self);
        if (code == self && action == N(batchsend)) {
            execute_action(&dispatcher, &handlepay::batchsend);
        } else if (code == self && action == N(batchsendtk)) {
            execute_action(&dispatcher, &handlepay::batchsendtk);
        } else if (code == self && action == N(claimfees)) {
            execute_action(&dispatcher, &handlepay::claimfees);
        } else if (code == self && action == N(claimmany)) {
            execute_action(&dispatcher, &handlepay::claimmany);
        } else if (code == self && action == N(claimnative)) {
            execute_action(&dispatcher, &handlepay::claimnative);
        } else if (code == self && action == N(setfeerate)) {
            execute_action(&dispatcher, &handlepay::setfeerate);
        } else if (code == self && action == N(setreceiver)) {
            execute_action(&dispatcher, &handlepay::setreceiver);
        } else if (code == self && action == N(setregistry)) {
            execute_action(&dispatcher, &handlepay::setregistry);
        } else if (code == self && action == N(setvault)) {
            execute_action(&dispatcher, &handlepay::setvault);
        } else if (code == self && action == N(setnative)) {
            execute_action(&dispatcher, &handlepay::setnative);
        } else if (code == self && action == N(setowner)) {
            execute_action(&dispatcher, &handlepay::setowner);
        } else if (code != self && action == N(transfer)) { //NOTE: any token contract may notify
            dispatcher.ontransfer(code, unpack_action_data<transfer_args>());
        }
    } //end apply
}; //end dispatcher
