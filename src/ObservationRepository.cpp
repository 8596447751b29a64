/* ===================================================================== *
 *  src/ObservationRepository.cpp
 * ===================================================================== */
#include "xraylc/ObservationRepository.hpp"
#include "xraylc/Errors.hpp"

#include <algorithm>
#include <cmath>
#include <mutex>
#include <utility>

namespace xraylc {

/* -------- mutation --------------------------------------------------- */
void InMemoryRepository::insert(Observation obs)
{
    insert(std::make_shared<const Observation>(std::move(obs)));
}

void InMemoryRepository::insert(ObservationPtr obs)
{
    if (!obs) throw InvalidObservation("InMemoryRepository::insert(): null observation");
    const long long id = obs->meta().obsid;
    std::unique_lock lk(mtx_);
    by_obsid_.insert_or_assign(id, std::move(obs));
}

bool InMemoryRepository::try_insert(ObservationPtr obs)
{
    if (!obs) throw InvalidObservation("InMemoryRepository::try_insert(): null observation");
    const long long id = obs->meta().obsid;
    std::unique_lock lk(mtx_);
    return by_obsid_.try_emplace(id, std::move(obs)).second;
}

bool InMemoryRepository::erase(long long obsid)
{
    std::unique_lock lk(mtx_);
    return by_obsid_.erase(obsid) > 0;
}

std::size_t InMemoryRepository::size() const
{
    std::shared_lock lk(mtx_);
    return by_obsid_.size();
}

void InMemoryRepository::clear()
{
    std::unique_lock lk(mtx_);
    by_obsid_.clear();
}

/* -------- lookup ----------------------------------------------------- */
ObservationPtr InMemoryRepository::find_by_obsid(long long obsid) const
{
    std::shared_lock lk(mtx_);
    auto it = by_obsid_.find(obsid);
    return it == by_obsid_.end() ? nullptr : it->second;
}

std::vector<ObservationPtr> InMemoryRepository::find_near(const SkyPosition& centre,
                                                          Real               radius_deg) const
{
    std::vector<std::pair<Real, ObservationPtr>> hits;
    {
        std::shared_lock lk(mtx_);
        for (const auto& [id, obs] : by_obsid_) {
            const Real d = angular_separation(centre, {obs->meta().ra, obs->meta().dec});
            if (d <= radius_deg) hits.emplace_back(d, obs);
        }
    }
    /* nearest first; ObsID breaks ties so the order is reproducible */
    std::sort(hits.begin(), hits.end(), [](const auto& a, const auto& b) {
        if (a.first != b.first) return a.first < b.first;
        return a.second->meta().obsid < b.second->meta().obsid;
    });

    std::vector<ObservationPtr> out;
    out.reserve(hits.size());
    for (auto& h : hits) out.push_back(std::move(h.second));
    return out;
}

std::vector<ObservationPtr> InMemoryRepository::find_by_galaxy(const std::string& galaxy) const
{
    std::vector<ObservationPtr> out;
    {
        std::shared_lock lk(mtx_);
        for (const auto& [id, obs] : by_obsid_)
            if (obs->meta().galaxy == galaxy) out.push_back(obs);
    }
    std::sort(out.begin(), out.end(), [](const ObservationPtr& a, const ObservationPtr& b) {
        return a->meta().obsid < b->meta().obsid;
    });
    return out;
}

} // namespace xraylc
