#pragma once

#include <QDBusContext>
#include <QDBusMessage>
#include <QString>

#include "common/logging.hpp"

namespace pomotray {

// Log context for a message received from a bus peer: the sender's unique
// name as caller, "<interface>.<member>" as member, and "<sender>#<n>" as
// correlation id, n counting the calls this process has received.
logging::CallContext callContextFor(const QDBusMessage &message);

// As above while a QtDBus slot is being invoked from the bus; a local
// context named after member when the slot was called in-process.
logging::CallContext callContextFor(const QDBusContext &context, const QString &member);

} // namespace pomotray
