#include "core/log_categories.hpp"

namespace ssrp {

Q_LOGGING_CATEGORY(ssrpParserLog, "ssrp.parser")
Q_LOGGING_CATEGORY(ssrpExchangeLog, "ssrp.exchange")

} // namespace ssrp
