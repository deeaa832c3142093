#ifndef HOLDPLAY_CORE_LOGGING_H
#define HOLDPLAY_CORE_LOGGING_H

#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(lcMedia)
Q_DECLARE_LOGGING_CATEGORY(lcInput)
Q_DECLARE_LOGGING_CATEGORY(lcFullscreen)
Q_DECLARE_LOGGING_CATEGORY(lcSession)
Q_DECLARE_LOGGING_CATEGORY(lcConfig)

#endif // HOLDPLAY_CORE_LOGGING_H
