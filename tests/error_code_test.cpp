#include "async_tls/core/config_loader.hpp"
#include "async_tls/core/error_code.hpp"
#include "async_tls/stream/stream_error.hpp"
#include "async_tls/tls/tls_error.hpp"

#include <gtest/gtest.h>

#include <cerrno>
#include <cstring>
#include <sstream>

TEST(error_code, would_block_only_in_errno_domain){
    EXPECT_TRUE(is_would_block(error_code::from_errno(EAGAIN)));
    EXPECT_TRUE(is_would_block(error_code::from_errno(EWOULDBLOCK)));
    EXPECT_FALSE(is_would_block(error_code::from_errno(EIO)));
    EXPECT_FALSE(is_would_block(error_code::from_config(EAGAIN)));
}

TEST(error_code, reset_and_abort_both_count_as_aborted){
    EXPECT_TRUE(is_connection_aborted(error_code::from_errno(ECONNRESET)));
    EXPECT_TRUE(is_connection_aborted(error_code::from_errno(ECONNABORTED)));
    EXPECT_FALSE(is_connection_aborted(error_code::from_errno(EPIPE)));
    EXPECT_FALSE(is_connection_aborted(error_code::from_stream(ECONNRESET)));
}

TEST(error_code, tls_domain_is_invalid_data){
    EXPECT_TRUE(is_invalid_data(error_code::from_tls(tls::tls_error::protocol_error)));
    EXPECT_FALSE(is_invalid_data(error_code::from_errno(EPROTO)));
}

TEST(error_code, domains_do_not_compare_equal){
    EXPECT_NE(error_code::from_errno(1), error_code::from_config(1));
    EXPECT_NE(error_code::from_tls(1), error_code::from_stream(1));
    EXPECT_EQ(error_code::from_stream(stream_error::handshake_eof), error_code::from_stream(1));
}

TEST(error_code, to_string_per_domain){
    EXPECT_EQ(to_string(error_code::from_errno(EPIPE)), std::string(std::strerror(EPIPE)));
    EXPECT_EQ(
        to_string(error_code::from_config(config_loader::config_error::duplicate_key)),
        "config duplicate key"
    );
    EXPECT_NE(to_string(error_code::from_stream(stream_error::handshake_eof)).find("handshake_eof"), std::string::npos);
    EXPECT_NE(
        to_string(error_code::from_stream(stream_error::handshake_already_consumed)).find("handshake_already_consumed"),
        std::string::npos
    );
    EXPECT_EQ(to_string(error_code::from_tls(tls::tls_error::alert_received)), "tls.alert_received");

    std::ostringstream os;
    os << error_code::from_tls(tls::tls_error::ca_load_failed);
    EXPECT_EQ(os.str(), "tls.ca_load_failed");
}

TEST(tls_error, code_packs_kind_and_reason){
    int code = tls::make_code(tls::tls_error::verify_failed, 20);
    EXPECT_EQ(tls::kind_of(code), tls::tls_error::verify_failed);
    EXPECT_EQ(tls::reason_of(code), 20);
    EXPECT_EQ(tls::kind_of(0), tls::tls_error::unknown);
}

TEST(tls_error, verify_reason_is_appended){
    // 20 = X509_V_ERR_UNABLE_TO_GET_ISSUER_CERT_LOCALLY
    std::string text = tls::tls_strerror(tls::make_code(tls::tls_error::verify_failed, 20));
    EXPECT_EQ(text.rfind("tls.verify_failed (reason: ", 0), 0u);
    EXPECT_EQ(tls::tls_strerror(tls::make_code(tls::tls_error::verify_failed)), "tls.verify_failed");
}

TEST(tls_error, kind_groups){
    EXPECT_TRUE(tls::is_verify_error(tls::tls_error::verify_hostname_mismatch));
    EXPECT_TRUE(tls::is_verify_error(tls::tls_error::verify_no_peer_cert));
    EXPECT_FALSE(tls::is_verify_error(tls::tls_error::protocol_error));

    EXPECT_TRUE(tls::is_setup_error(tls::tls_error::ca_load_failed));
    EXPECT_TRUE(tls::is_setup_error(tls::tls_error::bio_create_failed));
    EXPECT_FALSE(tls::is_setup_error(tls::tls_error::alert_received));
    EXPECT_FALSE(tls::is_setup_error(tls::tls_error::unknown));
}
