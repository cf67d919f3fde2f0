/**
 * Call-scoped lock for handlepay contracts. Constructing a call_guard fails the action if another guarded
 * entry point of the same contract is still running; the lock is released when the guard leaves scope.
 *
 * Inline actions and notifications only run after the sending action has returned, so the lock is always
 * clear by then and ReentrantCall can only fire if a guarded entry point calls another one directly.
 *
 * @copyright defined in handlepay/LICENSE.txt
 */
#pragma once

#include <eosiolib/eosio.hpp>
#include <eosiolib/singleton.hpp>

using namespace eosio;

struct lock_state {
    bool locked;

    EOSLIB_SERIALIZE(lock_state, (locked))
};

typedef singleton<N(calllock), lock_state> lock_singleton;

class call_guard {
    public:
        call_guard(account_name self) : self(self), locks(self, self) {
            auto state = locks.get_or_default(lock_state{ false });
            eosio_assert(!state.locked, "ReentrantCall: contract call already in progress");

            locks.set(lock_state{ true }, self);
        }

        ~call_guard() {
            locks.set(lock_state{ false }, self);
        }

    private:
        account_name self;
        lock_singleton locks;
};
