#include "xraylc/Observation.hpp"
#include "xraylc/Errors.hpp"
#include <algorithm>
#include <cmath>
#include <sstream>

namespace xraylc {

namespace {

std::string describe(const Sample& s)
{
    std::ostringstream os;
    os << "(t=" << s.time << ", counts=" << s.counts << ")";
    return os.str();
}

Real median_spacing(const std::vector<Sample>& s)
{
    std::vector<Real> dt;
    dt.reserve(s.size());
    for (std::size_t i = 1; i < s.size(); ++i) {
        const Real d = s[i].time - s[i - 1].time;
        if (d > 0.0) dt.push_back(d);
    }
    if (dt.empty()) return 0.0;

    const auto mid = dt.begin() + dt.size() / 2;
    std::nth_element(dt.begin(), mid, dt.end());
    if (dt.size() % 2 == 1) return *mid;
    const Real lo = *std::max_element(dt.begin(), mid);
    return 0.5 * (lo + *mid);
}

} // unnamed namespace

Observation::Observation(std::vector<Sample> samples, ObservationMeta meta)
    : meta_(std::move(meta))
{
    if (samples.empty())
        throw InvalidObservation("Observation: sample sequence is empty");

    for (const auto& s : samples) {
        if (s.counts < 0)
            throw InvalidObservation("Observation: negative counts in sample " + describe(s));
        if (!std::isfinite(s.time))
            throw InvalidObservation("Observation: non-finite timestamp in sample " + describe(s));
    }

    if (!std::isfinite(meta_.ra) || meta_.ra < 0.0 || meta_.ra >= 360.0)
        throw InvalidObservation("Observation: right ascension must lie in [0, 360) deg");
    if (!std::isfinite(meta_.dec) || meta_.dec < -90.0 || meta_.dec > 90.0)
        throw InvalidObservation("Observation: declination must lie in [-90, 90] deg");

    /* ---- order by time, merge duplicate timestamps ------------------ */
    std::stable_sort(samples.begin(), samples.end(),
                     [](const Sample& a, const Sample& b) { return a.time < b.time; });

    samples_.reserve(samples.size());
    for (const auto& s : samples) {
        if (!samples_.empty() && samples_.back().time == s.time)
            samples_.back().counts += s.counts;
        else
            samples_.push_back(s);
    }

    for (std::size_t i = 1; i < samples_.size(); ++i)
        if (!(samples_[i].time > samples_[i - 1].time))
            throw InvalidObservation("Observation: timestamps are not monotonic after sorting");

    for (const auto& s : samples_) total_counts_ += s.counts;
    cadence_ = median_spacing(samples_);

    /* ---- exposure window -------------------------------------------- */
    exposure_start_ = meta_.exposure_start.value_or(first_time());
    exposure_end_   = meta_.exposure_end.value_or(last_time() + cadence_);

    if (!std::isfinite(exposure_start_) || !std::isfinite(exposure_end_))
        throw InvalidObservation("Observation: exposure window must be finite");
    if (exposure_end_ < exposure_start_)
        throw InvalidObservation("Observation: exposure end precedes exposure start");
    if (exposure_start_ > first_time() || exposure_end_ < last_time())
        throw InvalidObservation("Observation: samples fall outside the exposure window");
}

Vector Observation::times() const
{
    Vector t(static_cast<Eigen::Index>(samples_.size()));
    for (std::size_t i = 0; i < samples_.size(); ++i)
        t[static_cast<Eigen::Index>(i)] = samples_[i].time;
    return t;
}

Vector Observation::counts() const
{
    Vector c(static_cast<Eigen::Index>(samples_.size()));
    for (std::size_t i = 0; i < samples_.size(); ++i)
        c[static_cast<Eigen::Index>(i)] = static_cast<Real>(samples_[i].counts);
    return c;
}

} // namespace xraylc
