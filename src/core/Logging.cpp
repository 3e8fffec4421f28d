#include "core/Logging.hpp"

#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/trivial.hpp>

namespace mdk {

bool setLogLevel(const QString& name)
{
    namespace logging = boost::log;

    const std::string level = name.trimmed().toLower().toStdString();
    logging::trivial::severity_level severity = logging::trivial::info;
    const bool known = logging::trivial::from_string(level.c_str(), level.size(), severity);
    if (!known)
        severity = logging::trivial::info;

    logging::core::get()->set_filter(logging::trivial::severity >= severity);

    if (!known)
        BOOST_LOG_TRIVIAL(warning) << "[Logging] Unknown level '" << level << "', using info";
    return known;
}

} // namespace mdk
