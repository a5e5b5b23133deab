#include "connection.hpp"

namespace NOdin {
namespace NSpa {

std::string FormatWsMessage(const std::string& service, const std::string& type, const nlohmann::json& payload) {
    nlohmann::json message = {
        {"service", service},
        {"type", type},
        {"payload", payload},
    };
    return message.dump();
}

TResult<TWsEnvelope> ParseWsMessage(std::string_view text) {
    auto message = nlohmann::json::parse(text, nullptr, false);
    if (message.is_discarded()) {
        return MakeError(EErrorKind::ProtocolError, "websocket message is not JSON");
    }
    if (!message.is_object()) {
        return MakeError(EErrorKind::ProtocolError, "websocket message is not a JSON object");
    }
    auto service = message.find("service");
    auto type = message.find("type");
    if (service == message.end() || !service->is_string() || type == message.end() || !type->is_string()) {
        return MakeError(EErrorKind::ProtocolError, "websocket message needs string 'service' and 'type'");
    }

    TWsEnvelope envelope;
    envelope.Service = service->get<std::string>();
    envelope.Type = type->get<std::string>();
    if (auto payload = message.find("payload"); payload != message.end()) {
        envelope.Payload = std::move(*payload);
    }
    return envelope;
}

bool TSpaConnection::Send(const std::string& service, const std::string& type, const nlohmann::json& payload) {
    return SendText(FormatWsMessage(service, type, payload));
}

bool TSpaConnection::SendText(std::string text) {
    if (!Channel_ || !Channel_->Send(std::move(text))) {
        return false;
    }
    ++SentFrames_;
    return true;
}

void TSpaConnection::Close(uint16_t code, std::string reason) {
    if (Channel_) {
        Channel_->Close(code, std::move(reason));
    }
}

bool TSpaConnection::IsOpen() const {
    return Channel_ && Channel_->IsOpen();
}

bool TSpaConnection::Pending() const {
    return Channel_ && Channel_->Pending();
}

} // namespace NSpa
} // namespace NOdin
