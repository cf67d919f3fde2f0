/**
 * Handle key derivation. A handle is stored by the sha256 digest of its bytes; the first 64 bits of the
 * digest give the table scope (and the registry primary key) so lookups never touch the string itself.
 *
 * @copyright defined in handlepay/LICENSE.txt
 */
#pragma once

#include <eosiolib/eosio.hpp>
#include <eosiolib/crypto.h>
#include <eosiolib/types.hpp>

#include <string>
#include <cstring>

using namespace std;
using namespace eosio;

checksum256 handle_hash(const string& handle) {
    checksum256 digest;
    sha256(handle.c_str(), handle.size(), &digest);
    return digest;
}

uint64_t handle_key(const checksum256& digest) {
    uint64_t key;
    memcpy(&key, digest.hash, sizeof(key));
    return key;
}

uint64_t handle_key(const string& handle) {
    return handle_key(handle_hash(handle));
}

bool same_hash(const checksum256& a, const checksum256& b) {
    return memcmp(a.hash, b.hash, sizeof(a.hash)) == 0;
}
