#include "typemaster/logging.hpp"

Q_LOGGING_CATEGORY(lcApp, "typemaster.app")
Q_LOGGING_CATEGORY(lcSession, "typemaster.session")
