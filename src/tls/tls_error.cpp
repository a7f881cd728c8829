#include "async_tls/tls/tls_error.hpp"

#include <array>
#include <openssl/err.h>
#include <openssl/x509_vfy.h>
#include <string_view>
#include <utility>

namespace tls{
    namespace{
        constexpr std::array<std::pair<tls_error, std::string_view>, 24> kind_names{{
            {tls_error::unknown, "tls.unknown"},
            {tls_error::openssl_init_failed, "tls.openssl_init_failed"},
            {tls_error::min_protocol_set_failed, "tls.min_protocol_set_failed"},
            {tls_error::ctx_create_failed, "tls.ctx_create_failed"},
            {tls_error::cert_chain_load_failed, "tls.cert_chain_load_failed"},
            {tls_error::private_key_load_failed, "tls.private_key_load_failed"},
            {tls_error::private_key_check_failed, "tls.private_key_check_failed"},
            {tls_error::default_verify_paths_failed, "tls.default_verify_paths_failed"},
            {tls_error::ca_load_failed, "tls.ca_load_failed"},
            {tls_error::session_create_failed, "tls.session_create_failed"},
            {tls_error::bio_create_failed, "tls.bio_create_failed"},
            {tls_error::set_sni_failed, "tls.set_sni_failed"},
            {tls_error::set_host_failed, "tls.set_host_failed"},
            {tls_error::handshake_failed, "tls.handshake_failed"},
            {tls_error::ssl_library_error, "tls.ssl_library_error"},
            {tls_error::alert_received, "tls.alert_received"},
            {tls_error::protocol_error, "tls.protocol_error"},
            {tls_error::shutdown_failed, "tls.shutdown_failed"},
            {tls_error::early_data_failed, "tls.early_data_failed"},
            {tls_error::verify_no_peer_cert, "tls.verify_no_peer_cert"},
            {tls_error::verify_failed, "tls.verify_failed"},
            {tls_error::verify_hostname_mismatch, "tls.verify_hostname_mismatch"},
            {tls_error::verify_cert_expired, "tls.verify_cert_expired"},
            {tls_error::verify_cert_not_yet_valid, "tls.verify_cert_not_yet_valid"}
        }};

        std::string_view kind_name(tls_error kind){
            for(const auto& [k, name] : kind_names){
                if(k == kind) return name;
            }
            return "tls.unknown";
        }

        // Verify kinds carry an X509_V_ERR_* value, every other kind an
        // ERR_GET_REASON value from the SSL library.
        std::string reason_text(tls_error kind, int reason){
            const char* text = nullptr;
            if(is_verify_error(kind)) text = ::X509_verify_cert_error_string(reason);
            else text = ::ERR_reason_error_string(ERR_PACK(ERR_LIB_SSL, 0, static_cast<unsigned long>(reason)));

            if(text == nullptr) return {};
            return std::string(text);
        }
    }

    bool is_verify_error(tls_error kind){
        switch(kind){
            case tls_error::verify_no_peer_cert:
            case tls_error::verify_failed:
            case tls_error::verify_hostname_mismatch:
            case tls_error::verify_cert_expired:
            case tls_error::verify_cert_not_yet_valid:
                return true;
            default:
                return false;
        }
    }

    bool is_setup_error(tls_error kind){
        return static_cast<int>(kind) >= static_cast<int>(tls_error::openssl_init_failed)
            && static_cast<int>(kind) <= static_cast<int>(tls_error::set_host_failed);
    }

    std::string tls_strerror(int code){
        tls_error kind = kind_of(code);
        std::string out(kind_name(kind));

        int reason = reason_of(code);
        if(reason == 0) return out;

        std::string text = reason_text(kind, reason);
        if(!text.empty()) out += " (reason: " + text + ")";
        return out;
    }
}
