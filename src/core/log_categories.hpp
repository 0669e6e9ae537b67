#pragma once

#include <QLoggingCategory>

namespace ssrp {

// "ssrp.parser": field length warnings, and rejected datagrams at debug level.
Q_DECLARE_LOGGING_CATEGORY(ssrpParserLog)

// "ssrp.exchange": socket setup, sends, received datagrams, completion.
Q_DECLARE_LOGGING_CATEGORY(ssrpExchangeLog)

} // namespace ssrp
