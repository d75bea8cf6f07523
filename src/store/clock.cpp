#include "store/clock.hpp"
#include "error/metadata_error.hpp"
#include <boost/log/trivial.hpp>
#include <cstdlib>
#include <iomanip>
#include <sstream>

namespace pdfmeta {
namespace store {

LocalTime SystemClock::now() const {
  const std::time_t timepoint = std::time(nullptr);

  LocalTime local;
  if (localtime_r(&timepoint, &local.calendar) == nullptr) {
    BOOST_LOG_TRIVIAL(error) << "Clock: Failed to convert current time to local time";
    throw MetadataError("Clock: Failed to read local time");
  }
  local.utc_offset_seconds = local.calendar.tm_gmtoff;
  return local;
}

std::string format_pdf_date(const LocalTime& time) {
  char buffer[32];
  if (std::strftime(buffer, sizeof(buffer), "D:%Y%m%d%H%M%S", &time.calendar) == 0) {
    throw MetadataError("Clock: Failed to format date");
  }

  const long magnitude = std::labs(time.utc_offset_seconds);
  std::ostringstream ss;
  ss << buffer
     << (time.utc_offset_seconds >= 0 ? '+' : '-')
     << std::setw(2) << std::setfill('0') << magnitude / 3600
     << '\''
     << std::setw(2) << std::setfill('0') << (magnitude % 3600) / 60
     << '\'';
  return ss.str();
}

} // namespace store
} // namespace pdfmeta
