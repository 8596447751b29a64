#pragma once
#include <stdexcept>
#include <string>

namespace xraylc {

/*  Every failure raised by the analysis engine derives from AnalysisError,
 *  so a caller may handle all of them in one place.  The concrete classes
 *  additionally derive from the matching std:: exception family.          */
class AnalysisError {
public:
    virtual ~AnalysisError() = default;
    virtual const char* kind() const noexcept = 0;
    virtual const char* message() const noexcept = 0;
};

#define XRAYLC_DEFINE_ERROR(Name, Base)                                    \
    class Name : public Base, public AnalysisError {                       \
    public:                                                                \
        explicit Name(const std::string& msg) : Base(msg) {}               \
        const char* kind() const noexcept override { return #Name; }       \
        const char* message() const noexcept override { return what(); }   \
    };

/* malformed or empty input samples / metadata */
XRAYLC_DEFINE_ERROR(InvalidObservation,    std::invalid_argument)
/* bin width <= 0 or not finite */
XRAYLC_DEFINE_ERROR(InvalidBinWidth,       std::invalid_argument)
/* running-average window outside [1, n] */
XRAYLC_DEFINE_ERROR(InvalidWindow,         std::invalid_argument)
/* zero duration, zero mean rate, ... */
XRAYLC_DEFINE_ERROR(DegenerateObservation, std::runtime_error)
/* series too short for the requested operation */
XRAYLC_DEFINE_ERROR(InsufficientData,      std::runtime_error)
/* bad option value in a JSON configuration */
XRAYLC_DEFINE_ERROR(ConfigError,           std::runtime_error)

#undef XRAYLC_DEFINE_ERROR

} // namespace xraylc
