#ifndef PDFMETA_LOGGER_HPP
#define PDFMETA_LOGGER_HPP

#include <boost/log/trivial.hpp>
#include <string>

namespace pdfmeta::logging {

// Installs a synchronous file sink (truncated on start, auto-flushed) and
// drops records below `min_level`. Replaces any sinks already installed.
void init_logging(const std::string& log_file = "pdfmeta.log",
                  boost::log::trivial::severity_level min_level = boost::log::trivial::info);

// Parses trace|debug|info|warning|error|fatal. Throws std::invalid_argument otherwise.
boost::log::trivial::severity_level parse_severity(const std::string& text);

} // namespace pdfmeta::logging

#endif // PDFMETA_LOGGER_HPP
