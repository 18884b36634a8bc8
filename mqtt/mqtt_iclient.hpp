#pragma once

#include <functional>
#include <string>

namespace mqtt {

class IClient
{
public:
    virtual ~IClient() = default;

    using MessageCallback = std::function<void(const std::string &, const std::string &)>;
    using ConnectCallback = std::function<void()>;
    using DisconnectCallback = std::function<void(int)>;

    virtual void connect() = 0;
    virtual void disconnect() = 0;
    virtual bool isConnected() = 0;

    virtual void subscribe(const std::string &topic) = 0;
    virtual void publish(const std::string &topic, const std::string &payload) = 0;
    virtual void publishRetained(const std::string &topic, const std::string &payload) = 0;

    // Сообщение, которое брокер опубликует при обрыве связи. Задаётся до connect().
    virtual void setLastWill(const std::string &topic, const std::string &payload) = 0;

    virtual void setMessageCallback(MessageCallback callback) = 0;
    virtual void setConnectCallback(ConnectCallback callback) = 0;
    virtual void setDisconnectCallback(DisconnectCallback callback) = 0;
};

} // namespace mqtt
