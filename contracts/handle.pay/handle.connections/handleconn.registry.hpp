/**
 * Read-only view of the identity registry. The registry stores one row per handle in its handles table,
 * scoped to the registry account and keyed by handle_key(). Nothing here writes registry state.
 *
 * @copyright defined in handlepay/LICENSE.txt
 */
#pragma once

#include "handleconn.ledger.hpp"

#include <eosiolib/eosio.hpp>
#include <eosiolib/types.hpp>

#include <string>

using namespace std;
using namespace eosio;

struct handle_entry {
    uint64_t key;
    string handle;
    account_name owner;

    uint64_t primary_key() const { return key; }
    EOSLIB_SERIALIZE(handle_entry, (key)(handle)(owner))
};

typedef multi_index<N(handles), handle_entry> handles_table;

/**
 * @brief Maps a handle to its owning account, or 0 when the handle is not registered.
 */
class identity_resolver {
    public:
        virtual ~identity_resolver() {}

        virtual account_name resolve(const string& handle) const = 0;
};

class registry_resolver : public identity_resolver {
    public:
        registry_resolver(account_name registry) : registry(registry) {}

        account_name resolve(const string& handle) const override {
            if (registry == 0 || handle.empty()) {
                return 0;
            }

            handles_table handles(registry, registry);
            auto h = handles.find(handle_key(handle));

            //NOTE: a 64 bit key collision resolves to nobody
            if (h == handles.end() || h->handle != handle) {
                return 0;
            }

            return h->owner;
        }

    private:
        account_name registry;
};
