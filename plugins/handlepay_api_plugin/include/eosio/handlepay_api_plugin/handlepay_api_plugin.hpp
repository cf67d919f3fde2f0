/**
 *
 *  @copyright defined in handlepay/LICENSE.txt
 */
#pragma once
#include <appbase/application.hpp>
#include <eosio/handlepay_plugin/handlepay_plugin.hpp>
#include <eosio/chain_plugin/chain_plugin.hpp>
#include <eosio/http_plugin/http_plugin.hpp>

namespace eosio {

    using namespace appbase;

    class handlepay_api_plugin : public appbase::plugin<handlepay_api_plugin> {
    public:

        APPBASE_PLUGIN_REQUIRES((handlepay_plugin)(http_plugin))

        handlepay_api_plugin();
        virtual ~handlepay_api_plugin();

        virtual void set_program_options(options_description&, options_description& cfg) override {}

        void plugin_initialize(const variables_map& options);
        void plugin_startup();
        void plugin_shutdown();

    private:
        std::unique_ptr<class handlepay_api_plugin_impl> my;
    };

}
