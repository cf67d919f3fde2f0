/**
 * Minimal identity registry used by the unit tests. The contract account binds handles to owners directly;
 * the table layout matches what handleconn.registry.hpp reads.
 *
 * @copyright defined in handlepay/LICENSE.txt
 */

#include <../../../contracts/handle.pay/handle.connections/handleconn.ledger.hpp>

#include <eosiolib/eosio.hpp>
#include <eosiolib/types.hpp>

#include <string>

using namespace std;
using namespace eosio;

class mockregistry : public contract {
    public:

        mockregistry(account_name self) : contract(self) {}

        /// @abi table handles i64
        struct handle_entry {
            uint64_t key;
            string handle;
            account_name owner;

            uint64_t primary_key() const { return key; }
            EOSLIB_SERIALIZE(handle_entry, (key)(handle)(owner))
        };

        typedef multi_index<N(handles), handle_entry> handles_table;

        /// @abi action
        void setowner(string handle, account_name owner) {
            require_auth(_self);
            eosio_assert(!handle.empty(), "handle cannot be empty");

            handles_table handles(_self, _self);
            uint64_t key = handle_key(handle);
            auto h = handles.find(key);

            if (h == handles.end()) {
                handles.emplace(_self, [&]( auto& a ){
                    a.key = key;
                    a.handle = handle;
                    a.owner = owner;
                });
            } else {
                handles.modify(h, 0, [&]( auto& a ) {
                    a.handle = handle;
                    a.owner = owner;
                });
            }
        }

        /// @abi action
        void unset(string handle) {
            require_auth(_self);

            handles_table handles(_self, _self);
            auto h = handles.find(handle_key(handle));
            eosio_assert(h != handles.end(), "handle is not registered");

            handles.erase(h);
        }
};

EOSIO_ABI(mockregistry, (setowner)(unset))
