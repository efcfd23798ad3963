#include "telegram/td_login.hpp"
#include "util.hpp"

#include <iostream>
#include <unistd.h>

namespace mtsatori {

namespace {

LoginFailure failure_for(const BackendError& e) {
    if (e.code() == 400 || e.code() == 401) return LoginFailure::BadCredentials;
    return LoginFailure::NetworkError;
}

std::string read_code() {
    std::cout << "Telegram login code: " << std::flush;
    std::string code;
    std::getline(std::cin, code);
    return trim(code);
}

} // namespace

TdLoginDriver::TdLoginDriver(const Config& config)
    : config_(config)
    , step_timeout_(std::chrono::seconds(config.bridge.rpc_timeout_sec))
{
    interactive_ = isatty(STDIN_FILENO) != 0;
}

LoginOutcome TdLoginDriver::login() {
    return authorize(interactive_);
}

LoginOutcome TdLoginDriver::resume() {
    if (!backend_) return authorize(false);

    AuthState state = backend_->auth_state();
    if (state == AuthState::LoggingOut || state == AuthState::Closing ||
        state == AuthState::Closed) {
        return LoginOutcome::failed(LoginFailure::Revoked,
                                    std::string("authorization ") + auth_state_name(state));
    }
    if (state != AuthState::Ready) {
        return LoginOutcome::failed(LoginFailure::NetworkError,
                                    std::string("authorization ") + auth_state_name(state));
    }
    if (!backend_->wait_connected(step_timeout_)) {
        return LoginOutcome::failed(LoginFailure::NetworkError, "still offline");
    }
    try {
        return LoginOutcome::success(backend_, backend_->get_me());
    } catch (const BackendError& e) {
        return LoginOutcome::failed(failure_for(e), e.what());
    } catch (const BridgeError& e) {
        return LoginOutcome::failed(LoginFailure::NetworkError, e.what());
    }
}

void TdLoginDriver::logout(Backend& backend) {
    (void)backend;
    if (!backend_) return;
    try {
        backend_->log_out();
    } catch (const std::exception& e) {
        std::cerr << "[login] log out failed: " << e.what() << "\n";
    }
}

LoginOutcome TdLoginDriver::authorize(bool interactive) {
    // TDLib allows one receive loop per process; close the old client first.
    backend_.reset();

    auto backend = std::make_shared<TdBackend>(config_.account, config_.bridge,
                                               config_.tdlib_verbosity);
    LoginOutcome outcome;
    try {
        backend->start();
        outcome = authorize_on(backend, interactive);
    } catch (const BackendError& e) {
        outcome = LoginOutcome::failed(failure_for(e), e.what());
    } catch (const BridgeError& e) {
        outcome = LoginOutcome::failed(LoginFailure::NetworkError, e.what());
    }
    if (outcome.ok()) backend_ = backend;
    return outcome;
}

LoginOutcome TdLoginDriver::authorize_on(const std::shared_ptr<TdBackend>& backend,
                                         bool interactive) {
    const AccountConfig& account = config_.account;
    AuthState handled = AuthState::Unknown;

    for (;;) {
        AuthState state = backend->wait_auth_change(handled, step_timeout_);
        if (state == handled) {
            return LoginOutcome::failed(LoginFailure::NetworkError,
                                        std::string("timed out waiting in ") +
                                        auth_state_name(state));
        }
        std::cerr << "[login] " << auth_state_name(state) << "\n";

        switch (state) {
            case AuthState::Unknown:
                break;

            case AuthState::WaitParameters:
                if (config_.proxy.enabled()) send_proxy(*backend);
                send_parameters(*backend);
                break;

            case AuthState::WaitPhoneNumber:
                if (!account.bot_token.empty()) {
                    auto fn = td_api::make_object<td_api::checkAuthenticationBotToken>();
                    fn->token_ = account.bot_token;
                    backend->request(std::move(fn));
                } else if (!account.phone.empty()) {
                    auto fn = td_api::make_object<td_api::setAuthenticationPhoneNumber>();
                    fn->phone_number_ = account.phone;
                    backend->request(std::move(fn));
                } else {
                    return LoginOutcome::failed(LoginFailure::BadCredentials,
                                                "neither bot token nor phone configured");
                }
                break;

            case AuthState::WaitCode: {
                if (!interactive) {
                    return LoginOutcome::failed(LoginFailure::Revoked,
                                                "stored session is gone, login code required");
                }
                std::string code = read_code();
                if (code.empty()) {
                    return LoginOutcome::failed(LoginFailure::BadCredentials, "no login code");
                }
                auto fn = td_api::make_object<td_api::checkAuthenticationCode>();
                fn->code_ = code;
                backend->request(std::move(fn));
                break;
            }

            case AuthState::WaitPassword: {
                if (account.password.empty()) {
                    return LoginOutcome::failed(LoginFailure::SecondFactorRequired,
                                                "account has a cloud password");
                }
                auto fn = td_api::make_object<td_api::checkAuthenticationPassword>();
                fn->password_ = account.password;
                backend->request(std::move(fn));
                break;
            }

            case AuthState::WaitOther:
                return LoginOutcome::failed(LoginFailure::BadCredentials,
                                            "unsupported authorization step");

            case AuthState::Ready:
                return LoginOutcome::success(backend, backend->get_me());

            case AuthState::LoggingOut:
            case AuthState::Closing:
            case AuthState::Closed:
                return LoginOutcome::failed(LoginFailure::Revoked,
                                            std::string("authorization ") +
                                            auth_state_name(state));
        }
        handled = state;
    }
}

void TdLoginDriver::send_parameters(TdBackend& backend) {
    const AccountConfig& account = config_.account;
    std::string dir = expand_home(account.data_dir);

    auto fn = td_api::make_object<td_api::setTdlibParameters>();
    fn->use_test_dc_ = false;
    fn->database_directory_ = dir;
    fn->files_directory_ = dir + "/files";
    fn->use_file_database_ = true;
    fn->use_chat_info_database_ = true;
    fn->use_message_database_ = true;
    fn->use_secret_chats_ = false;
    fn->api_id_ = account.api_id;
    fn->api_hash_ = account.api_hash;
    fn->system_language_code_ = "en";
    fn->device_model_ = "Server";
    fn->system_version_ = "Linux";
    fn->application_version_ = "mtsatori 0.1";
    backend.request(std::move(fn));
}

void TdLoginDriver::send_proxy(TdBackend& backend) {
    const ProxyConfig& proxy = config_.proxy;

    auto fn = td_api::make_object<td_api::addProxy>();
    fn->server_ = proxy.hostname;
    fn->port_ = proxy.port;
    fn->enable_ = true;
    if (proxy.scheme == "http") {
        auto type = td_api::make_object<td_api::proxyTypeHttp>();
        type->username_ = proxy.username;
        type->password_ = proxy.password;
        fn->type_ = std::move(type);
    } else {
        auto type = td_api::make_object<td_api::proxyTypeSocks5>();
        type->username_ = proxy.username;
        type->password_ = proxy.password;
        fn->type_ = std::move(type);
    }
    try {
        backend.request(std::move(fn));
        std::cerr << "[login] using " << proxy.scheme << " proxy " << proxy.hostname
                  << ":" << proxy.port << "\n";
    } catch (const BackendError& e) {
        std::cerr << "[login] proxy rejected: " << e.what() << "\n";
    }
}

} // namespace mtsatori
