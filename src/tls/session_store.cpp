#include "async_tls/tls/session_store.hpp"
#include "async_tls/core/logger.hpp"
#include <mutex>

namespace{
int store_index = -1;
std::once_flag store_index_once;

int get_store_index(){
    std::call_once(store_index_once, [](){
        store_index = ::SSL_CTX_get_ex_new_index(0, nullptr, nullptr, nullptr, nullptr);
    });
    return store_index;
}
}

void session_store::session_deleter::operator()(SSL_SESSION* p) const noexcept{
    if(p) ::SSL_SESSION_free(p);
}

void session_store::attach(SSL_CTX* ctx, session_store* store){
    ::SSL_CTX_set_ex_data(ctx, get_store_index(), store);
    ::SSL_CTX_set_session_cache_mode(ctx, SSL_SESS_CACHE_CLIENT | SSL_SESS_CACHE_NO_INTERNAL_STORE);
    ::SSL_CTX_sess_set_new_cb(ctx, &session_store::on_new_session);
}

void session_store::detach(SSL_CTX* ctx) noexcept{
    ::SSL_CTX_set_ex_data(ctx, get_store_index(), nullptr);
}

int session_store::on_new_session(SSL* ssl, SSL_SESSION* sess){
    auto* store = static_cast<session_store*>(
        ::SSL_CTX_get_ex_data(::SSL_get_SSL_CTX(ssl), get_store_index())
    );
    const char* name = ::SSL_get_servername(ssl, TLSEXT_NAMETYPE_host_name);
    if(store == nullptr || name == nullptr) return 0;

    store->put(name, sess);
    logger::log_debug("session_store", "on_new_session", std::string("ticket stored for ") + name);
    return 1;
}

void session_store::put(std::string_view server_name, SSL_SESSION* sess){
    std::lock_guard<std::mutex> lock(mtx);
    sessions[std::string(server_name)].reset(sess);
}

bool session_store::resume(SSL* ssl, std::string_view server_name) const{
    std::lock_guard<std::mutex> lock(mtx);
    auto it = sessions.find(std::string(server_name));
    if(it == sessions.end()) return false;
    return ::SSL_set_session(ssl, it->second.get()) == 1;
}

void session_store::erase(std::string_view server_name){
    std::lock_guard<std::mutex> lock(mtx);
    sessions.erase(std::string(server_name));
}

std::size_t session_store::size() const{
    std::lock_guard<std::mutex> lock(mtx);
    return sessions.size();
}
