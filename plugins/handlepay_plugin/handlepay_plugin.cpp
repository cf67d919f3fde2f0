/**
 *  @file
 *  @copyright defined in handlepay/LICENSE.txt
 */
#include <eosio/handlepay_plugin/handlepay_plugin.hpp>
#include <eosio/chain/contract_table_objects.hpp>

namespace eosio {

    static appbase::abstract_plugin& _handlepay_plugin = app().register_plugin<handlepay_plugin>();

namespace handlepay_apis { namespace detail {
    // row layout of handlevault::vault_balance
    struct vault_row {
        uint64_t id;
        fc::sha256 handle_hash;
        chain::account_name contract;
        chain::asset balance;
    };
} }

} //namespace eosio

FC_REFLECT(eosio::handlepay_apis::detail::vault_row, (id)(handle_hash)(contract)(balance))

namespace eosio {

class handlepay_plugin_impl {
    public:

    handlepay_plugin_impl(){}
    ~handlepay_plugin_impl(){}

    chain::account_name dispatcher = N(handlepay);
    chain::account_name vault = N(handlevault);
};

handlepay_plugin::handlepay_plugin():my(new handlepay_plugin_impl()){}
handlepay_plugin::~handlepay_plugin(){}

void handlepay_plugin::set_program_options(options_description&, options_description& cfg) {
    cfg.add_options()
        ("handlepay-dispatcher-account", bpo::value<string>()->default_value("handlepay"), "Account the handlepay dispatcher contract is deployed to")
        ("handlepay-vault-account", bpo::value<string>()->default_value("handlevault"), "Account the handlevault contract is deployed to")
        ;
}

void handlepay_plugin::plugin_initialize(const variables_map& options) {

    ilog("initializing handlepay_plugin...");

    try {
        if( options.count( "handlepay-dispatcher-account" )) {
            my->dispatcher = chain::account_name(options.at("handlepay-dispatcher-account").as<string>());
        }
        if( options.count( "handlepay-vault-account" )) {
            my->vault = chain::account_name(options.at("handlepay-vault-account").as<string>());
        }
    }
    FC_LOG_AND_RETHROW()

    ilog("handlepay dispatcher: ${d}, vault: ${v}", ("d", my->dispatcher)("v", my->vault));
    ilog("intialization complete");
}

void handlepay_plugin::plugin_startup() {
    ilog("starting handlepay_plugin...");
}

void handlepay_plugin::plugin_shutdown() {
    ilog("shutting down handlepay_plugin...");
}

handlepay_apis::read_only handlepay_plugin::get_read_only_api()const {
    return handlepay_apis::read_only(app().get_plugin<chain_plugin>().chain(), my->dispatcher, my->vault);
}

namespace handlepay_apis {

template<typename Function>
void read_only::walk_table( chain::account_name code, uint64_t scope, chain::name table, Function f )const {
    const auto& d = db.db();
    const auto* t_id = d.find<chain::table_id_object, chain::by_code_scope_table>(boost::make_tuple(code, chain::scope_name(scope), table));
    if( t_id == nullptr ) {
        return;
    }

    const auto& idx = d.get_index<chain::key_value_index, chain::by_scope_primary>();
    auto lower = idx.lower_bound(boost::make_tuple(t_id->id));
    auto upper = idx.upper_bound(boost::make_tuple(t_id->id));

    for( auto itr = lower; itr != upper; ++itr ) {
        f(*itr);
    }
}

read_only::get_handle_key_results read_only::get_handle_key( const get_handle_key_params& p )const {
    EOS_ASSERT( !p.handle.empty(), chain::contract_table_query_exception, "handle cannot be empty" );

    get_handle_key_results results;
    results.handle = p.handle;
    results.hash = fc::sha256::hash(p.handle);
    results.scope = results.hash._hash[0]; //first 8 bytes of the digest, as the contracts read them
    return results;
}

read_only::get_vault_balances_results read_only::get_vault_balances( const get_vault_balances_params& p )const {
    auto key = get_handle_key(get_handle_key_params{ p.handle });

    get_vault_balances_results results;
    results.handle = p.handle;

    walk_table(vault, key.scope, N(balances), [&](const chain::key_value_object& obj) {
        detail::vault_row row;
        fc::datastream<const char*> ds(obj.value.data(), obj.value.size());
        fc::raw::unpack(ds, row);

        if( row.handle_hash == key.hash ) {
            results.balances.push_back(vault_entry{ row.contract, row.balance });
        }
    });

    return results;
}

read_only::get_fee_pools_results read_only::get_fee_pools( const get_fee_pools_params& p )const {
    EOS_ASSERT( p.code == dispatcher || p.code == vault, chain::contract_table_query_exception,
                "fee pools are kept by ${d} and ${v} only", ("d", dispatcher)("v", vault) );

    get_fee_pools_results results;

    walk_table(p.code, p.token_contract, N(feepools), [&](const chain::key_value_object& obj) {
        chain::asset pool;
        fc::datastream<const char*> ds(obj.value.data(), obj.value.size());
        fc::raw::unpack(ds, pool);
        results.pools.push_back(pool);
    });

    return results;
}

} //namespace handlepay_apis

} //namespace eosio
