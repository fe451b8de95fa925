// SPDX-License-Identifier: Apache-2.0
#include "server/auth/auth_provider.hpp"

#include "common/logger.hpp"

namespace pong::auth {

namespace {

constexpr size_t kMaxPlayerIdLength = 64;

class DisabledProvider : public IAuthProvider
{
public:
    AuthResult validate(std::string_view token) override
    {
        AuthResult r;
        if (token.empty()) {
            r.reason = "empty_token";
            return r;
        }
        r.ok = true;
        r.user_id = std::string(token.substr(0, kMaxPlayerIdLength));
        return r;
    }
};

class StubProvider : public IAuthProvider
{
public:
    explicit StubProvider(std::string prefix) : m_prefix(std::move(prefix)) {}

    AuthResult validate(std::string_view token) override
    {
        AuthResult r;
        if (token.empty()) {
            r.reason = "empty_token";
            return r;
        }
        if (token.substr(0, m_prefix.size()) != m_prefix) {
            r.reason = "bad_prefix";
            return r;
        }
        auto rest = token.substr(m_prefix.size());
        if (rest.empty()) {
            r.reason = "empty_player_id";
            return r;
        }
        r.ok = true;
        r.user_id = std::string(rest.substr(0, kMaxPlayerIdLength));
        return r;
    }

private:
    std::string m_prefix;
};

} // namespace

std::unique_ptr<IAuthProvider> make_provider(const std::string &mode, const std::string &stub_prefix)
{
    if (mode == "disabled")
        return std::make_unique<DisabledProvider>();
    if (mode != "stub")
        pong::log::warn("[auth] unknown auth_mode '{}', using stub", mode);
    return std::make_unique<StubProvider>(stub_prefix);
}

} // namespace pong::auth
