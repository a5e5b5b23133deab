#pragma once

#include <memory>

#include "service.hpp"

namespace NOdin {
namespace NSpa {

inline constexpr const char* OdinServiceName = "odin";

/**
 * @brief The service every SPA server carries first.
 *
 * Serves the client runtime: ws.js keeps the websocket open and dispatches
 * messages by service name, main.js wires the page up. Answers "ping"
 * messages with "pong".
 */
class TOdinService: public IService {
public:
    std::string Name() const override {
        return OdinServiceName;
    }

    void AddComponents(TComponentsBuilder& builder) override;

    TFuture<TResult<TWsReaction>> HandleWsMessage(TSpaConnection& conn, const std::string& type, const nlohmann::json& payload) override;
};

std::shared_ptr<IService> MakeOdinService();

} // namespace NSpa
} // namespace NOdin
