#pragma once

#include "chat/User.h"
#include "networking/Transport.h"

#include <string>
#include <utility>

namespace meshirc::networking {

enum class RegistrationState { Unregistered, Registered, InRoom, Disconnected };

struct Session {
    Session(ClientId id, std::string host) : client_id(id), user(std::move(host)) {}

    ClientId client_id;
    chat::User user;
    RegistrationState state = RegistrationState::Unregistered;

    bool registered() const noexcept {
        return state == RegistrationState::Registered || state == RegistrationState::InRoom;
    }
    bool in_room() const noexcept { return state == RegistrationState::InRoom; }
};

} // namespace meshirc::networking
