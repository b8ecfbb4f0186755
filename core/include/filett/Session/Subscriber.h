// Subscriber.h — живое соединение, которому сервер отправляет JSON сообщения
// Транспорт (WebSocket и т.п.) реализуется снаружи ядра

#pragma once

#include "../export.h"
#include <memory>
#include <string>

namespace FileTT {

class FTT_API Subscriber {
public:
    virtual ~Subscriber() = default;

    /// Уникальный ID соединения
    virtual std::string id() const = 0;

    /// Отправить одно сообщение.
    /// @return false если соединение разорвано (подписчик будет удалён)
    virtual bool send(const std::string& message) = 0;

    /// Закрыть соединение со стороны сервера
    virtual void close() {}
};

using SubscriberPtr = std::shared_ptr<Subscriber>;

} // namespace FileTT
