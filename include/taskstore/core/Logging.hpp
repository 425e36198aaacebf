#pragma once

#include <QLoggingCategory>

// Categories can be toggled with QT_LOGGING_RULES, e.g.
// QT_LOGGING_RULES="taskstore.actor.debug=true".
Q_DECLARE_LOGGING_CATEGORY(lcReplica)
Q_DECLARE_LOGGING_CATEGORY(lcActor)
Q_DECLARE_LOGGING_CATEGORY(lcStorage)
Q_DECLARE_LOGGING_CATEGORY(lcConfig)
