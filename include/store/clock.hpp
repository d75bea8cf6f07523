#ifndef PDFMETA_CLOCK_HPP
#define PDFMETA_CLOCK_HPP

#include <ctime>
#include <string>

namespace pdfmeta {
namespace store {

// Broken-down local time with its offset from UTC
struct LocalTime {
  std::tm calendar{};
  long utc_offset_seconds = 0;  // local minus UTC
};

class Clock {
public:
  virtual ~Clock() = default;
  virtual LocalTime now() const = 0;
};

class SystemClock : public Clock {
public:
  LocalTime now() const override;
};

// Formats a PDF date string: D:YYYYMMDDHHMMSS+HH'MM'
std::string format_pdf_date(const LocalTime& time);

} // namespace store
} // namespace pdfmeta

#endif // PDFMETA_CLOCK_HPP
