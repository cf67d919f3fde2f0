/**
 *
 *  @copyright defined in handlepay/LICENSE.txt
 */
#include <eosio/handlepay_api_plugin/handlepay_api_plugin.hpp>

namespace eosio {
    static appbase::abstract_plugin& _handlepay_api_plugin = app().register_plugin<handlepay_api_plugin>();

    class handlepay_api_plugin_impl {
    public:
        handlepay_api_plugin_impl(){}
        ~handlepay_api_plugin_impl(){}
    };

    handlepay_api_plugin::handlepay_api_plugin():my(new handlepay_api_plugin_impl()){}
    handlepay_api_plugin::~handlepay_api_plugin(){}

    void handlepay_api_plugin::plugin_initialize(const variables_map& options) {
        ilog("initializing handlepay_api_plugin...");
    }

#define CALL(api_name, api_handle, api_namespace, call_name) \
{std::string("/v1/" #api_name "/" #call_name), \
   [api_handle](string, string body, url_response_callback cb) mutable { \
          try { \
             if (body.empty()) body = "{}"; \
             auto result = api_handle.call_name(fc::json::from_string(body).as<api_namespace::call_name ## _params>()); \
             cb(200, fc::json::to_string(result)); \
          } catch (...) { \
             http_plugin::handle_exception(#api_name, #call_name, body, cb); \
          } \
       }}

#define HANDLEPAY_RO_CALL(call_name) CALL(handlepay, ro_api, handlepay_apis::read_only, call_name)

    void handlepay_api_plugin::plugin_startup() {
        ilog("starting handlepay_api_plugin...");
        auto ro_api = app().get_plugin<handlepay_plugin>().get_read_only_api();

        app().get_plugin<http_plugin>().add_api({
           HANDLEPAY_RO_CALL(get_handle_key),
           HANDLEPAY_RO_CALL(get_vault_balances),
           HANDLEPAY_RO_CALL(get_fee_pools)
        });
    }

    void handlepay_api_plugin::plugin_shutdown() {
        ilog("shutting down handlepay_api_plugin...");
    }

}
