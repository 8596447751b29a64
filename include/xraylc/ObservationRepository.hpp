/* ===================================================================== *
 *  include/xraylc/ObservationRepository.hpp  ––  injectable lookup of
 *  observations by ObsID / sky position / galaxy
 * ===================================================================== */
#pragma once
#include "Observation.hpp"
#include "Coordinates.hpp"

#include <ankerl/unordered_dense.h>
#include <memory>
#include <shared_mutex>
#include <string>
#include <vector>

namespace xraylc {

using ObservationPtr = std::shared_ptr<const Observation>;

/*
 *  Where observations come from.  The engine itself never owns one; the
 *  command-line layer (or a caller's archive client) provides it.
 */
class ObservationRepository
{
public:
    virtual ~ObservationRepository() = default;

    /* nullptr when unknown */
    virtual ObservationPtr find_by_obsid(long long obsid) const = 0;

    /* everything within radius_deg of `centre`, nearest first */
    virtual std::vector<ObservationPtr> find_near(const SkyPosition& centre,
                                                  Real               radius_deg) const = 0;

    virtual std::vector<ObservationPtr> find_by_galaxy(const std::string& galaxy) const = 0;
};

/*
 * Thread-safe in-memory repository with shared ownership of the stored
 * observations.  insert() replaces an ObsID that is already present;
 * try_insert() keeps the stored one and returns false.
 */
class InMemoryRepository : public ObservationRepository
{
public:
    InMemoryRepository() = default;

    void insert(Observation obs);
    void insert(ObservationPtr obs);
    bool try_insert(ObservationPtr obs);
    bool erase(long long obsid);
    std::size_t size() const;
    void clear();

    ObservationPtr find_by_obsid(long long obsid) const override;
    std::vector<ObservationPtr> find_near(const SkyPosition& centre,
                                          Real               radius_deg) const override;
    std::vector<ObservationPtr> find_by_galaxy(const std::string& galaxy) const override;

private:
    using Map = ankerl::unordered_dense::map<long long, ObservationPtr>;

    mutable std::shared_mutex mtx_;
    Map                       by_obsid_;
};

} // namespace xraylc
