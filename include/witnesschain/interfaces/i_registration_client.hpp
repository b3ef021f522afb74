#pragma once
#include "witnesschain/core/result.hpp"
#include "witnesschain/core/failures.hpp"
#include "witnesschain/session/registration_request.hpp"

namespace witnesschain::vault::interfaces {

class IRegistrationClient {
public:
    virtual ~IRegistrationClient() = default;

    [[nodiscard]] virtual Result<Unit, SessionFailure> Register(
        const session::RegistrationRequest& request) = 0;
};

}
