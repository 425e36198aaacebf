#include "taskstore/core/Logging.hpp"

Q_LOGGING_CATEGORY(lcReplica, "taskstore.replica", QtInfoMsg)
Q_LOGGING_CATEGORY(lcActor, "taskstore.actor", QtInfoMsg)
Q_LOGGING_CATEGORY(lcStorage, "taskstore.storage", QtInfoMsg)
Q_LOGGING_CATEGORY(lcConfig, "taskstore.config", QtInfoMsg)
