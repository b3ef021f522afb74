#pragma once
#include "witnesschain/interfaces/i_registration_client.hpp"
#include "witnesschain/session/linking_verifier.hpp"
#include <memory>
#include <optional>
#include <vector>

namespace witnesschain::vault::test_helpers {

/**
 * Records every registration. With a verifier attached it also plays the
 * server and runs the request through LinkingVerifier.
 */
class RecordingRegistrationClient : public interfaces::IRegistrationClient {
public:
    RecordingRegistrationClient() = default;

    explicit RecordingRegistrationClient(std::shared_ptr<session::LinkingVerifier> verifier)
        : verifier_(std::move(verifier)) {}

    [[nodiscard]] Result<Unit, SessionFailure> Register(const session::RegistrationRequest& request) override {
        requests_.push_back(request);
        if (failure_) {
            return Result<Unit, SessionFailure>::Err(*failure_);
        }
        if (verifier_) {
            return verifier_->VerifyRegistration(request);
        }
        return Result<Unit, SessionFailure>::Ok(unit);
    }

    void FailWith(SessionFailure failure) { failure_ = std::move(failure); }

    [[nodiscard]] const std::vector<session::RegistrationRequest>& Requests() const { return requests_; }

private:
    std::shared_ptr<session::LinkingVerifier> verifier_;
    std::optional<SessionFailure> failure_;
    std::vector<session::RegistrationRequest> requests_;
};

}
