#include "async_tls/tls/tls_connector.hpp"
#include "async_tls/core/logger.hpp"
#include "async_tls/tls/openssl_session.hpp"
#include <cerrno>

tls_connector::tls_connector(std::shared_ptr<tls_context> ctx) noexcept :
    ctx(std::move(ctx)){
    if(this->ctx != nullptr) early_data = this->ctx->early_data_enabled();
}

tls_connector& tls_connector::enable_early_data(bool on) noexcept{
    early_data = on;
    return *this;
}

bool tls_connector::early_data_enabled() const noexcept{ return early_data; }

std::expected <mid_handshake, error_code> tls_connector::connect(
    std::string_view server_name, std::unique_ptr<raw_endpoint> io
) const{
    if(ctx == nullptr || io == nullptr) return std::unexpected(error_code::from_errno(EINVAL));

    auto session_exp = openssl_session::create_client(*ctx, server_name);
    if(!session_exp){
        logger::log_error("client session setup failed", "tls_connector::connect()", session_exp);
        return std::unexpected(session_exp.error());
    }
    return start_client_handshake(std::move(io), std::move(*session_exp), early_data);
}

const tls_context& tls_connector::context() const noexcept{ return *ctx; }

tls_acceptor::tls_acceptor(std::shared_ptr<tls_context> ctx) noexcept :
    ctx(std::move(ctx)){}

std::expected <mid_handshake, error_code> tls_acceptor::accept(std::unique_ptr<raw_endpoint> io) const{
    if(ctx == nullptr || io == nullptr) return std::unexpected(error_code::from_errno(EINVAL));

    auto session_exp = openssl_session::create_server(*ctx);
    if(!session_exp){
        logger::log_error("server session setup failed", "tls_acceptor::accept()", session_exp);
        return std::unexpected(session_exp.error());
    }
    return start_server_handshake(std::move(io), std::move(*session_exp));
}

const tls_context& tls_acceptor::context() const noexcept{ return *ctx; }
