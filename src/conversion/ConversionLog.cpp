#include "ConversionLog.h"

Q_LOGGING_CATEGORY(lcConversion, "m4bmaker.conversion")
Q_LOGGING_CATEGORY(lcMedia, "m4bmaker.media")
Q_LOGGING_CATEGORY(lcApp, "m4bmaker.app")
