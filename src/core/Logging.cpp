#include "core/Logging.h"

Q_LOGGING_CATEGORY(lcMedia, "holdplay.media")
Q_LOGGING_CATEGORY(lcInput, "holdplay.input")
Q_LOGGING_CATEGORY(lcFullscreen, "holdplay.fullscreen")
Q_LOGGING_CATEGORY(lcSession, "holdplay.session")
Q_LOGGING_CATEGORY(lcConfig, "holdplay.config")
