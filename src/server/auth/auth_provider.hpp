// SPDX-License-Identifier: Apache-2.0
// auth_provider.hpp
// Pluggable token validation. The real wallet-signature check lives outside this service;
// these providers map a token to a stable player id.
#pragma once
#include <memory>
#include <string>
#include <string_view>

namespace pong::auth {

struct AuthResult
{
    bool ok{false};
    std::string user_id; // filled when ok
    std::string reason; // error reason when !ok
};

class IAuthProvider
{
public:
    virtual ~IAuthProvider() = default;
    virtual AuthResult validate(std::string_view token) = 0;
};

// "stub": token must start with `stub_prefix`; the remainder is the player id.
// "disabled": any non-empty token is taken as the player id.
// Unknown modes fall back to "stub".
std::unique_ptr<IAuthProvider> make_provider(const std::string &mode, const std::string &stub_prefix);

} // namespace pong::auth
