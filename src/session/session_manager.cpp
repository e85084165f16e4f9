#include "securecookie/session/session_manager.hpp"
#include "securecookie/debug/cookie_logger.hpp"

#include <google/protobuf/message.h>

namespace securecookie::session {

Result<CookieSessionManager, CookieFailure> CookieSessionManager::Create(
    std::shared_ptr<const cookies::CookieEncryptor> encryptor,
    configuration::SessionConfig config,
    std::shared_ptr<const ICookiePolicy> policy,
    std::shared_ptr<const cookies::IValueEncoder<google::protobuf::Message>> encoder) {
    if (!encryptor) {
        return Result<CookieSessionManager, CookieFailure>::Err(
            CookieFailure::Config("Session manager needs a cookie encryptor"));
    }
    if (auto valid = config.Validate(); valid.IsErr()) {
        return Result<CookieSessionManager, CookieFailure>::Err(std::move(valid).UnwrapErr());
    }
    if (!policy) {
        policy = std::make_shared<HostCookiePolicy>(config);
    }
    if (!encoder) {
        encoder = std::make_shared<cookies::ProtobufJsonEncoder>();
    }
    return Result<CookieSessionManager, CookieFailure>::Ok(CookieSessionManager(
        Store(std::move(encryptor), std::move(encoder)),
        std::move(config),
        std::move(policy)));
}

Result<Unit, CookieFailure> CookieSessionManager::Current(
    const interfaces::IRequest& request,
    ISession& session) const {
    auto loaded = store_.Get(request, config_.cookie_name, session.MutableState());
    if (loaded.IsErr()) {
        session.MutableState().Clear();
        debug::LogSessionRejected(config_.cookie_name, loaded.UnwrapErr().type);
        return Result<Unit, CookieFailure>::Err(std::move(loaded).UnwrapErr());
    }
    if (auto valid = session.Validate(request); valid.IsErr()) {
        session.MutableState().Clear();
        debug::LogSessionRejected(config_.cookie_name, valid.UnwrapErr().type);
        return valid;
    }
    return Result<Unit, CookieFailure>::Ok(unit);
}

Result<Unit, CookieFailure> CookieSessionManager::Update(
    interfaces::IResponseWriter& response,
    const interfaces::IRequest& request,
    const ISession& session) const {
    return store_.Set(response, config_.cookie_name, policy_->OptionsFor(request), session.State())
        .Map([](http::Cookie) { return unit; });
}

Result<Unit, CookieFailure> CookieSessionManager::End(
    interfaces::IResponseWriter& response,
    const interfaces::IRequest& request) const {
    return store_.Delete(response, config_.cookie_name, policy_->OptionsFor(request))
        .Map([](http::Cookie) { return unit; });
}

Result<SessionOrigin, CookieFailure> CookieSessionManager::CurrentOrStart(
    const interfaces::IRequest& request,
    ISession& session,
    const SessionFactory& factory) const {
    auto current = Current(request, session);
    if (current.IsOk()) {
        return Result<SessionOrigin, CookieFailure>::Ok(SessionOrigin::Resumed);
    }
    if (!current.UnwrapErr().IsRejectedSession()) {
        return Result<SessionOrigin, CookieFailure>::Err(std::move(current).UnwrapErr());
    }
    if (!factory) {
        return Result<SessionOrigin, CookieFailure>::Err(
            CookieFailure::Config("No session factory configured"));
    }
    return factory(request, session).Map([](Unit) { return SessionOrigin::Started; });
}

}
